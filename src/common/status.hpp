#pragma once

/**
 * @file status.hpp
 * @brief Internal status implementation
 *
 * This file re-exports the public status.hpp and adds internal utilities.
 */

#include "suffixsort/status.hpp"

namespace suffixsort {

/**
 * @brief Macro to return early if status is not OK
 */
#define SUFFIXSORT_RETURN_IF_ERROR(expr)   \
    do {                                   \
        auto _status = (expr);             \
        if (!_status.ok()) {               \
            return _status;                \
        }                                  \
    } while (false)

}  // namespace suffixsort
