/**
 * @file line_io.cpp
 * @brief Line reader and writer implementation
 */

#include "io/line_io.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "suffixsort/sorter.hpp"

namespace suffixsort {

namespace {

Status read_file(const std::string& path, std::vector<std::string>* lines) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Status::NotFound("'" + path + "': No such file or directory");
    }
    if (std::filesystem::is_directory(path, ec)) {
        return Status::InvalidArgument("'" + path + "': Is a directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Status::IOError("'" + path + "': Cannot open file");
    }

    Status status = read_lines(in, lines);
    if (!status.ok()) {
        return Status(status.code(), "'" + path + "': " + std::string(status.message()));
    }
    return Status::Ok();
}

}  // namespace

Status read_lines(std::istream& in, std::vector<std::string>* lines) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines->push_back(std::move(line));
        line.clear();
    }

    if (in.bad()) {
        return Status::IOError("Read failed");
    }
    return Status::Ok();
}

Status read_input(const std::vector<std::string>& files, std::vector<std::string>* lines) {
    if (files.empty()) {
        return read_lines(std::cin, lines);
    }

    for (const auto& file : files) {
        if (file == config::kStdinPath) {
            SUFFIXSORT_RETURN_IF_ERROR(read_lines(std::cin, lines));
        } else {
            SUFFIXSORT_RETURN_IF_ERROR(read_file(file, lines));
        }
        LOG_DEBUG("Read '{}', {} lines so far", file, lines->size());
    }

    return Status::Ok();
}

Status write_output(std::ostream& out, const SortResult& result, const SortConfig& config) {
    for (const auto& line : result.lines) {
        out << project_line(line, config, result.padding) << '\n';
    }
    out.flush();

    if (!out) {
        return Status::IOError("Write failed");
    }
    return Status::Ok();
}

}  // namespace suffixsort
