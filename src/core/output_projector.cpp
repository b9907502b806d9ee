/**
 * @file output_projector.cpp
 * @brief Output projection implementation
 */

#include "core/output_projector.hpp"

#include <algorithm>

#include "common/config.hpp"
#include "suffixsort/sorter.hpp"

namespace suffixsort {

namespace {

bool prints_key_only(const SortConfig& config) noexcept {
    return config.word_only && !config.use_entire_line;
}

}  // namespace

PaddingInfo compute_padding_info(const std::vector<ProcessedLine>& lines,
                                 const SortConfig& config) noexcept {
    PaddingInfo info;
    info.use_end_column = !prints_key_only(config);

    for (const auto& line : lines) {
        if (!line.word_found) {
            continue;
        }
        const size_t width = info.use_end_column ? line.key_end_column() : line.key_width;
        info.max_width = std::max(info.max_width, width);
    }

    return info;
}

std::string project_line(const ProcessedLine& line, const SortConfig& config,
                         const std::optional<PaddingInfo>& padding) {
    const bool key_only = prints_key_only(config);

    size_t pad = 0;
    if (padding.has_value() && line.word_found) {
        const size_t width = padding->use_end_column ? line.key_end_column() : line.key_width;
        if (padding->max_width > width) {
            pad = padding->max_width - width;
        }
    }

    const std::string_view text = key_only ? line.key() : std::string_view(line.original);

    std::string out;
    out.reserve(pad + text.size());
    out.append(pad, config::kPadChar);
    out.append(text);
    return out;
}

std::vector<std::string> project_lines(const SortResult& result, const SortConfig& config) {
    std::vector<std::string> out;
    out.reserve(result.lines.size());
    for (const auto& line : result.lines) {
        out.push_back(project_line(line, config, result.padding));
    }
    return out;
}

}  // namespace suffixsort
