#pragma once

/**
 * @file line_io.hpp
 * @brief Reading input lines and writing sorted output
 */

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "suffixsort/processed_line.hpp"
#include "suffixsort/sort_config.hpp"

namespace suffixsort {

/**
 * @brief Append every line of `in` to `lines`
 *
 * Line terminators ("\n" or "\r\n") are stripped. A final line without a
 * terminator is kept; an empty stream adds nothing.
 */
[[nodiscard]] Status read_lines(std::istream& in, std::vector<std::string>* lines);

/**
 * @brief Read lines from files in order, or from stdin
 * @param files Paths; empty or "-" means standard input
 * @param lines Receives the lines of all inputs, concatenated
 */
[[nodiscard]] Status read_input(const std::vector<std::string>& files,
                                std::vector<std::string>* lines);

/**
 * @brief Write the projected lines of a result, one per line
 */
[[nodiscard]] Status write_output(std::ostream& out, const SortResult& result,
                                  const SortConfig& config);

}  // namespace suffixsort
