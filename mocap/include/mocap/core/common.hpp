#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for the mocap library
 */

#include <cstddef>
#include <string>
#include <cpptrace/cpptrace.hpp>

#include "profiler.hpp"
#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define MOCAP_ASSERT(condition, message)                                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        mocap::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}",\
            message, trace);                                                   \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define MOCAP_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Cast Helper Functions (to reduce static_cast noise)
// ============================================================================

namespace mocap::util {

template <typename T>
constexpr size_t sz(T value) noexcept {
  return static_cast<size_t>(value);
}

} // namespace mocap::util
