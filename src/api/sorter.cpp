/**
 * @file sorter.cpp
 * @brief Pipeline: extract keys, normalize, filter, sort
 *
 * Extraction and normalization are independent per line and run under
 * the parallel execution policy for large inputs. Sorting is delegated to
 * the sort driver.
 */

#include "suffixsort/sorter.hpp"

#include <algorithm>
#include <execution>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "core/key_extractor.hpp"
#include "core/key_normalizer.hpp"
#include "core/output_projector.hpp"
#include "core/sort_driver.hpp"

namespace suffixsort {

namespace {

void analyze_line(ProcessedLine& line, const SortConfig& config) {
    const ExtractedKey key = extract_key(line.original, config);
    line.key_offset = key.offset;
    line.key_length = key.length;
    line.key_column = key.column;
    line.key_width = key.width;
    line.word_found = key.word_found;
    line.sort_key = normalize_key(line.key(), config);
}

}  // namespace

SortResult process_lines(const SortConfig& config, std::vector<std::string> lines) {
    LOG_DEBUG("Processing {} lines", lines.size());

    SortResult result;
    result.lines.resize(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        result.lines[i].original = std::move(lines[i]);
        result.lines[i].index = i;
    }

    auto analyze = [&config](ProcessedLine& line) { analyze_line(line, config); };
    if (result.lines.size() >= config::kParallelThreshold) {
        std::for_each(std::execution::par, result.lines.begin(), result.lines.end(), analyze);
    } else {
        std::for_each(result.lines.begin(), result.lines.end(), analyze);
    }
    LOG_DEBUG("Extracted keys from {} lines", result.lines.size());

    if (config.exclude_no_word) {
        const size_t dropped = std::erase_if(
            result.lines, [](const ProcessedLine& line) { return !line.word_found; });
        LOG_DEBUG("Dropped {} lines without a word", dropped);
    }

    if (config.right_align) {
        result.padding = compute_padding_info(result.lines, config);
    }

    sort_lines(result.lines, config);

    return result;
}

}  // namespace suffixsort
