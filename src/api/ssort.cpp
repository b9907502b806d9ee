/**
 * @file ssort.cpp
 * @brief Command line front end: inverse lexicographic (suffix) sort
 *
 * Sorts lines by their first word (default) or whole line, comparing
 * strings from the last character towards the first.
 */

#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>

#include "common/logger.hpp"
#include "io/line_io.hpp"
#include "suffixsort/suffixsort.hpp"

namespace suffixsort {

void print_help(std::ostream& out) {
    out << "Usage: ssort [OPTION]... [FILE]...\n"
        << "ssort: inverse lexicographic (suffix) sort by first word (default) or whole line\n"
        << "\n"
        << "With no FILE, or when FILE is -, read standard input.\n"
        << "\n"
        << "Sorting Options:\n"
        << "  -i, --ignore-case       ignore case when sorting\n"
        << "  -l, --line              use entire line for sorting instead of first word\n"
        << "  -d, --dictionary-order  a word is the first run of alphabetic characters\n"
        << "  -r, --reverse           reverse the sort order\n"
        << "  -s, --stable            keep the input order of lines with equal keys\n"
        << "  -n, --normalize         compare keys in Unicode NFC form\n"
        << "\n"
        << "Output:\n"
        << "  -a, --right-align       right-align keys by adding leading spaces\n"
        << "  -x, --exclude-no-word   exclude lines without words\n"
        << "  -w, --word-only         output only the word used for sorting\n"
        << "\n"
        << "  -v, --verbose           log progress to standard error\n"
        << "  -h, --help              show this help and exit\n"
        << "  -V, --version           show version and exit\n";
}

int run(int argc, char* argv[]) {
    static const option long_options[] = {
        {"ignore-case", no_argument, nullptr, 'i'},
        {"line", no_argument, nullptr, 'l'},
        {"dictionary-order", no_argument, nullptr, 'd'},
        {"reverse", no_argument, nullptr, 'r'},
        {"stable", no_argument, nullptr, 's'},
        {"normalize", no_argument, nullptr, 'n'},
        {"right-align", no_argument, nullptr, 'a'},
        {"exclude-no-word", no_argument, nullptr, 'x'},
        {"word-only", no_argument, nullptr, 'w'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    SortConfig config;
    bool verbose = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "ildrsnaxwvhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'i': config.ignore_case = true; break;
            case 'l': config.use_entire_line = true; break;
            case 'd': config.dictionary_order = true; break;
            case 'r': config.reverse = true; break;
            case 's': config.stable = true; break;
            case 'n': config.normalize = true; break;
            case 'a': config.right_align = true; break;
            case 'x': config.exclude_no_word = true; break;
            case 'w': config.word_only = true; break;
            case 'v': verbose = true; break;
            case 'h':
                print_help(std::cout);
                return 0;
            case 'V':
                std::cout << "ssort " << version() << "\n";
                return 0;
            default:
                std::cerr << "Try 'ssort --help' for more information.\n";
                return 2;
        }
    }

    Logger::init(config::kLoggerName, verbose ? spdlog::level::debug : spdlog::level::warn);

    const std::vector<std::string> files(argv + optind, argv + argc);
    std::vector<std::string> lines;
    Status status = read_input(files, &lines);
    if (!status.ok()) {
        std::cerr << "ssort: " << status.to_string() << "\n";
        return 1;
    }
    LOG_DEBUG("Read {} lines from {} inputs", lines.size(), files.empty() ? size_t{1} : files.size());

    const SortResult result = process_lines(config, std::move(lines));

    status = write_output(std::cout, result, config);
    if (!status.ok()) {
        std::cerr << "ssort: " << status.to_string() << "\n";
        return 1;
    }

    return 0;
}

}  // namespace suffixsort

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);

    try {
        return suffixsort::run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ssort: " << e.what() << std::endl;
        return 1;
    }
}
