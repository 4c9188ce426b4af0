#ifndef VELLUM_SEVERITY_HPP
#define VELLUM_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "vellum/fwd.hpp"
#include "vellum/vellum.h"

namespace vellum {

enum struct Severity : Default_Underlying {
    min = VELLUM_SEVERITY_MIN,
    trace = VELLUM_SEVERITY_TRACE,
    debug = VELLUM_SEVERITY_DEBUG,
    info = VELLUM_SEVERITY_INFO,
    soft_warning = VELLUM_SEVERITY_SOFT_WARNING,
    warning = VELLUM_SEVERITY_WARNING,
    error = VELLUM_SEVERITY_ERROR,
    fatal = VELLUM_SEVERITY_FATAL,
    max = VELLUM_SEVERITY_MAX,
    none = VELLUM_SEVERITY_NONE,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case min: return u8"MIN";
    case trace: return u8"TRACE";
    case debug: return u8"DEBUG";
    case info: return u8"INFO";
    case soft_warning: return u8"SOFTWARN";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case fatal: return u8"FATAL";
    case none: break;
    }
    return u8"???";
}

} // namespace vellum

#endif
