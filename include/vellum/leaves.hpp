#ifndef VELLUM_LEAVES_HPP
#define VELLUM_LEAVES_HPP

#include <charconv>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "vellum/util/assert.hpp"
#include "vellum/util/strings.hpp"

#include "vellum/render.hpp"
#include "vellum/settings.hpp"
#include "vellum/template_builder.hpp"

namespace vellum {

// STRINGS =========================================================================================
// Plain text is escaped. Use `Raw` to write markup.

namespace detail {

template <string_like8 S>
[[nodiscard]]
constexpr std::u8string_view text_of(const S& self) noexcept
{
    return std::u8string_view(self);
}

/// @brief A null pointer is treated as an empty string.
[[nodiscard]]
constexpr std::u8string_view text_of(const char8_t* self) noexcept
{
    return self ? std::u8string_view(self) : std::u8string_view {};
}

template <string_like8 S>
struct Escaped_String_Traits {
    [[nodiscard]]
    static constexpr std::size_t size_hint(const S& self) noexcept
    {
        return text_of(self).size();
    }

    static void render_once(S&& self, Template_Builder& out)
    {
        out.write_escaped(text_of(self));
    }

    static void render_mut(S& self, Template_Builder& out)
    {
        out.write_escaped(text_of(self));
    }

    static void render(const S& self, Template_Builder& out)
    {
        out.write_escaped(text_of(self));
    }
};

} // namespace detail

template <>
struct Producer_Traits<std::u8string_view> : detail::Escaped_String_Traits<std::u8string_view> { };

template <>
struct Producer_Traits<const char8_t*> : detail::Escaped_String_Traits<const char8_t*> { };

template <typename Alloc>
struct Producer_Traits<std::basic_string<char8_t, std::char_traits<char8_t>, Alloc>>
    : detail::Escaped_String_Traits<std::basic_string<char8_t, std::char_traits<char8_t>, Alloc>> {
};

// PRIMITIVES ======================================================================================

/// @brief Integers and floating-point numbers, excluding `bool` and character types.
template <typename T>
concept number = std::is_arithmetic_v<T> && !std::same_as<T, bool> && !std::same_as<T, char>
    && !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> && !std::same_as<T, char16_t>
    && !std::same_as<T, char32_t>;

namespace detail {

template <typename T>
struct Always_Renderable_Traits {
    [[nodiscard]]
    static constexpr std::size_t size_hint(const T&) noexcept
    {
        return 0;
    }

    static void render_once(T&& self, Template_Builder& out)
    {
        Producer_Traits<T>::render(self, out);
    }

    static void render_mut(T& self, Template_Builder& out)
    {
        Producer_Traits<T>::render(self, out);
    }
};

} // namespace detail

/// @brief Numbers are written in their shortest decimal representation,
/// as obtained from `std::to_chars`.
template <number T>
struct Producer_Traits<T> : detail::Always_Renderable_Traits<T> {
    static void render(const T& self, Template_Builder& out)
    {
        char buffer[to_chars_buffer_size];
        const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), self);
        VELLUM_ASSERT(result.ec == std::errc {});
        out.write_escaped(as_u8string_view(std::string_view { buffer, result.ptr }));
    }
};

template <>
struct Producer_Traits<bool> : detail::Always_Renderable_Traits<bool> {
    static void render(const bool& self, Template_Builder& out)
    {
        out.write_escaped(self ? u8"true" : u8"false");
    }
};

template <>
struct Producer_Traits<char8_t> : detail::Always_Renderable_Traits<char8_t> {
    static void render(const char8_t& self, Template_Builder& out)
    {
        out.write_escaped(self);
    }
};

// OPTIONAL ========================================================================================

/// @brief `std::optional` has the capabilities of its value type.
/// A disengaged optional writes nothing.
template <typename T>
struct Producer_Traits<std::optional<T>> {
    using Self = std::optional<T>;

    [[nodiscard]]
    static constexpr std::size_t size_hint(const Self& self)
    {
        return self ? Producer_Traits<T>::size_hint(*self) : 0;
    }

    static constexpr void render_once(Self&& self, Template_Builder& out)
        requires render_once_producer<T>
    {
        if (self) {
            Producer_Traits<T>::render_once(*std::move(self), out);
        }
    }

    static constexpr void render_mut(Self& self, Template_Builder& out)
        requires render_mut_producer<T>
    {
        if (self) {
            Producer_Traits<T>::render_mut(*self, out);
        }
    }

    static constexpr void render(const Self& self, Template_Builder& out)
        requires render_producer<T>
    {
        if (self) {
            Producer_Traits<T>::render(*self, out);
        }
    }
};

} // namespace vellum

#endif
