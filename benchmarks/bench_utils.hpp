#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace suffixsort::bench {

/**
 * @brief Random "word rest-of-line" lines drawn from a fixed alphabet
 *
 * Word lengths vary between 1 and 12 characters; a small alphabet gives
 * plenty of shared suffixes.
 */
inline std::vector<std::string> make_lines(size_t count, uint64_t seed = 42) {
    static constexpr char kAlphabet[] = "aeinorstlcAEINORST";
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> letter(0, sizeof(kAlphabet) - 2);
    std::uniform_int_distribution<size_t> length(1, 12);

    std::vector<std::string> lines;
    lines.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::string line;
        const size_t n = length(rng);
        for (size_t j = 0; j < n; ++j) {
            line += kAlphabet[letter(rng)];
        }
        line += ' ';
        line += std::to_string(i);
        lines.push_back(std::move(line));
    }
    return lines;
}

}  // namespace suffixsort::bench
