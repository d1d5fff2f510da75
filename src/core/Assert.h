#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), ARMYSEARCH_ASSERT is never compiled out.
 * Use for invariants whose violation means a bug in the search engine or in
 * an operator, never for conditions a caller can recover from.
 *
 * When an assertion fails:
 * - Logs a CRITICAL message with file, line, and condition
 * - Aborts the program immediately
 *
 * Example:
 *   ARMYSEARCH_ASSERT(!child.empty(), "Mutation " + name + " produced an empty army");
 */
#define ARMYSEARCH_ASSERT(condition, message)                                               \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
