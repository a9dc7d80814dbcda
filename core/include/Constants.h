#pragma once

/**
 * @file Constants.h
 * @brief Default chunking parameters and I/O sizes for SeqCDC
 *
 * Magic numbers used across the library live here so the defaults
 * stay in one place.
 */

#include <cstddef>
#include <cstdint>

namespace SeqCDC::defaults {

// =============================================================================
// Chunking Parameters
// =============================================================================

/// Reinforcing comparisons required before a cut is declared
constexpr std::uint64_t SEQ_THRESHOLD = 5;

/// Opposing comparisons tolerated before the scan skips ahead
constexpr std::uint64_t JUMP_TRIGGER = 50;

/// Bytes skipped each time the jump trigger fires
constexpr std::uint64_t JUMP_SIZE = 256;

/// Smallest chunk emitted, except for the trailing remainder (bytes)
constexpr std::uint64_t MIN_BLOCK_SIZE = 4096;

/// Target average chunk size, informational only (bytes)
constexpr std::uint64_t AVG_BLOCK_SIZE = 8192;

/// Largest chunk emitted (bytes)
constexpr std::uint64_t MAX_BLOCK_SIZE = 16384;

// =============================================================================
// I/O Configuration
// =============================================================================

/// Read size used by FileUtils::readFileBuffered (bytes)
constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;  // 64KB

} // namespace SeqCDC::defaults
