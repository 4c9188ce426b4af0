#ifndef VELLUM_RAW_HPP
#define VELLUM_RAW_HPP

#include <cstddef>
#include <string_view>
#include <utility>

#include "vellum/util/strings.hpp"

#include "vellum/fwd.hpp"
#include "vellum/leaves.hpp"
#include "vellum/template_builder.hpp"

namespace vellum {

/// @brief Raw content marker.
/// The wrapped text is written verbatim, without any escaping,
/// no matter how the `Raw` is rendered.
/// This is meant for trusted or pre-rendered markup.
///
/// Only `render() const` is provided;
/// `render_mut` and `render_once` are obtained from it through `Producer_Traits`.
template <typename S>
struct Raw {
    static_assert(string_like8<S>, "The content of Raw must be convertible to std::u8string_view.");

private:
    S m_content;

public:
    [[nodiscard]]
    constexpr explicit Raw(S content) noexcept(std::is_nothrow_move_constructible_v<S>)
        : m_content(std::move(content))
    {
    }

    [[nodiscard]]
    constexpr const S& content() const noexcept
    {
        return m_content;
    }

    [[nodiscard]]
    constexpr std::size_t size_hint() const noexcept
    {
        return std::u8string_view(m_content).size();
    }

    void render(Template_Builder& out) const
    {
        out.write_raw(std::u8string_view(m_content));
    }
};

template <std::size_t N>
Raw(const char8_t (&)[N]) -> Raw<std::u8string_view>;

} // namespace vellum

#endif
