#ifndef VELLUM_ASSERT_HPP
#define VELLUM_ASSERT_HPP

#include "ulight/impl/assert.hpp"

// Precondition checks on producers and the builder.
// Failures are reported through ulight's assertion handler.

#define VELLUM_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
/// @brief Like `VELLUM_ASSERT`, but only checked in debug builds.
/// Used on hot paths, such as escaping.
#define VELLUM_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define VELLUM_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

#endif
