#ifndef VELLUM_HTML_NAMES_HPP
#define VELLUM_HTML_NAMES_HPP

#include <string_view>

#include "ulight/impl/lang/html.hpp"

namespace vellum {

/// @brief Returns `true` if `str` is a valid HTML tag identifier.
/// This includes both builtin tag names (which are purely alphabetic)
/// and custom tag names such as `foo-bar`.
[[nodiscard]]
constexpr bool is_html_tag_name(std::u8string_view str)
{
    return ulight::html::is_tag_name(str);
}

} // namespace vellum

#endif
