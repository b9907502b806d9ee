#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for suffixsort
 */

#include <cstddef>

namespace suffixsort {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Parallelism
// ─────────────────────────────────────────────────────────────────────────────

/// Below this many lines extraction and sorting run sequentially
constexpr size_t kParallelThreshold = 4096;

// ─────────────────────────────────────────────────────────────────────────────
// Text Decoding
// ─────────────────────────────────────────────────────────────────────────────

/// Ill-formed UTF-8 byte b decodes to kIllFormedByteBase | b (U+DC80..U+DCFF)
constexpr char32_t kIllFormedByteBase = 0xDC00;

// ─────────────────────────────────────────────────────────────────────────────
// Output
// ─────────────────────────────────────────────────────────────────────────────

/// Character used for right alignment
constexpr char kPadChar = ' ';

// ─────────────────────────────────────────────────────────────────────────────
// Command Line
// ─────────────────────────────────────────────────────────────────────────────

/// Name of the command line program and of its logger
constexpr const char* kLoggerName = "ssort";

/// File argument that stands for standard input
constexpr const char* kStdinPath = "-";

}  // namespace config
}  // namespace suffixsort
