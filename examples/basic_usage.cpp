/**
 * @file basic_usage.cpp
 * @brief Basic usage example for suffixsort
 */

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <suffixsort/suffixsort.hpp>

int main() {
    std::cout << "suffixsort v" << suffixsort::version() << "\n\n";

    std::vector<std::string> lines = {
        "Night  noun",  "light  noun", "bright adjective", "sing   verb",
        "ring   noun",  "Spring noun", "-- no word here", "fright noun",
    };

    // Rhyming words end up next to each other
    suffixsort::SortConfig config;
    config.ignore_case = true;
    config.stable = true;
    config.right_align = true;
    config.dictionary_order = true;

    auto result = suffixsort::process_lines(config, lines);
    for (const auto& line : suffixsort::project_lines(result, config)) {
        std::cout << line << "\n";
    }

    // The comparator alone works with any sorting algorithm
    std::cout << "\nComparator with std::sort:\n";
    auto cmp = suffixsort::make_comparator(suffixsort::SortConfig{});
    std::vector<std::string> words = {"zz", "a", "bz", "ab", "ba", "b"};
    std::sort(words.begin(), words.end(),
              [&cmp](const std::string& a, const std::string& b) { return cmp.less(a, b); });
    for (const auto& word : words) {
        std::cout << "  " << word << "\n";
    }

    return 0;
}
