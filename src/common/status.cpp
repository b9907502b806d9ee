/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "suffixsort/status.hpp"

namespace suffixsort {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:              result = "OK"; break;
        case StatusCode::kInvalidArgument: result = "InvalidArgument"; break;
        case StatusCode::kNotFound:        result = "NotFound"; break;
        case StatusCode::kIOError:         result = "IOError"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace suffixsort
