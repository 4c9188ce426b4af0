#ifndef VELLUM_DIAGNOSTIC_HPP
#define VELLUM_DIAGNOSTIC_HPP

#include <string_view>

#include "vellum/util/severity.hpp"

#include "vellum/fwd.hpp"

namespace vellum {

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

/// @brief A `Text_Sink` refused a write.
/// Everything rendered after that point is discarded.
inline constexpr std::u8string_view write_failed = u8"write.failed";

/// @brief A producer reported an error through `Template_Builder::record_error`.
inline constexpr std::u8string_view render_error = u8"render.error";

/// @brief A size hint exceeded the configured maximum reservation and was clamped.
inline constexpr std::u8string_view size_hint_clamped = u8"size-hint.clamped";

} // namespace diagnostic

} // namespace vellum

#endif
