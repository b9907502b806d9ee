#pragma once

/**
 * @file suffixsort.hpp
 * @brief Main include header for suffixsort
 *
 * Include this single header to access the public API of suffixsort.
 */

#include "suffixsort/processed_line.hpp"
#include "suffixsort/sort_config.hpp"
#include "suffixsort/sorter.hpp"
#include "suffixsort/status.hpp"

namespace suffixsort {

/**
 * @brief Get the version string of suffixsort
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

/**
 * @brief Get the major version number
 */
constexpr int version_major() noexcept {
    return 0;
}

/**
 * @brief Get the minor version number
 */
constexpr int version_minor() noexcept {
    return 1;
}

/**
 * @brief Get the patch version number
 */
constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace suffixsort
