#ifndef VELLUM_ELEMENT_HPP
#define VELLUM_ELEMENT_HPP

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "vellum/util/assert.hpp"
#include "vellum/util/html_names.hpp"

#include "vellum/fwd.hpp"
#include "vellum/leaves.hpp"
#include "vellum/render.hpp"
#include "vellum/template_builder.hpp"

namespace vellum {

/// @brief An HTML element with the given tag name, such as `<p>...</p>`,
/// whose content is another producer.
/// An `Element` has the same capabilities as its content.
/// The tag name is copied, so it may refer to a temporary string.
template <typename P>
struct Element {
    static_assert(render_once_producer<P>);

private:
    std::u8string m_tag;
    P m_content;

    void open(Template_Builder& out) const
    {
        out.write_raw(u8"<");
        out.write_raw(m_tag);
        out.write_raw(u8">");
    }

    void close(Template_Builder& out) const
    {
        out.write_raw(u8"</");
        out.write_raw(m_tag);
        out.write_raw(u8">");
    }

public:
    /// @brief Constructor.
    /// `is_html_tag_name(tag)` shall be `true`.
    [[nodiscard]]
    constexpr Element(std::u8string_view tag, P content)
        : m_tag { tag }
        , m_content(std::move(content))
    {
        VELLUM_ASSERT(is_html_tag_name(m_tag));
    }

    [[nodiscard]]
    constexpr std::u8string_view tag() const noexcept
    {
        return m_tag;
    }

    /// @brief Returns the size of the tags plus the size hint of the content,
    /// saturated at the greatest `std::size_t`.
    [[nodiscard]]
    constexpr std::size_t size_hint() const
    {
        constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
        const std::size_t tags = (2 * m_tag.size()) + 5;
        const std::size_t content = Producer_Traits<P>::size_hint(m_content);
        return content > max - tags ? max : tags + content;
    }

    void render_once(Template_Builder& out) &&
    {
        open(out);
        Producer_Traits<P>::render_once(std::move(m_content), out);
        close(out);
    }

    void render_mut(Template_Builder& out)
        requires render_mut_producer<P>
    {
        open(out);
        Producer_Traits<P>::render_mut(m_content, out);
        close(out);
    }

    void render(Template_Builder& out) const
        requires render_producer<P>
    {
        open(out);
        Producer_Traits<P>::render(m_content, out);
        close(out);
    }
};

/// @brief Creates an `Element` from a tag name and content.
/// String literals are stored as pointers, and other content is stored by value.
/// To refer to an existing producer instead of copying it, pass `by_ref(p)` or `by_mut(p)`.
template <typename P>
[[nodiscard]]
constexpr Element<std::decay_t<P>> element(std::u8string_view tag, P&& content)
{
    return { tag, std::forward<P>(content) };
}

/// @brief Creates an `Element` without content, like `<div></div>`.
[[nodiscard]]
constexpr Element<std::u8string_view> element(std::u8string_view tag)
{
    return { tag, std::u8string_view {} };
}

} // namespace vellum

#endif
