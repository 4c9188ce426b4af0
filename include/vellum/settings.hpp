#ifndef VELLUM_SETTINGS_HPP
#define VELLUM_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#define VELLUM_HOT ULIGHT_HOT

#ifdef ULIGHT_EXCEPTIONS
#define VELLUM_EXCEPTIONS ULIGHT_EXCEPTIONS
#endif

namespace vellum {

/// @brief The greatest amount of code units that a size hint may reserve in a sink
/// before any output is written.
/// Size hints are advisory, so a larger hint is clamped to this value rather than trusted.
inline constexpr std::size_t default_max_reservation = std::size_t(1) << 24;

/// @brief The buffer size used when converting numbers to text.
inline constexpr std::size_t to_chars_buffer_size = 64;

} // namespace vellum

#endif
