#ifndef VELLUM_STRINGS_HPP
#define VELLUM_STRINGS_HPP

#include <concepts>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vellum {

/// @brief A type whose values can be viewed as UTF-8 text without copying.
template <typename T>
concept string_like8 = std::convertible_to<const T&, std::u8string_view>;

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Appends text to a vector without any processing.
inline void append(std::pmr::vector<char8_t>& out, std::u8string_view text)
{
    out.insert(out.end(), text.begin(), text.end());
}

template <typename Traits, typename Alloc>
inline void append(std::basic_string<char8_t, Traits, Alloc>& out, std::u8string_view text)
{
    out.append(text);
}

} // namespace vellum

#endif
