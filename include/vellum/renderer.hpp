#ifndef VELLUM_RENDERER_HPP
#define VELLUM_RENDERER_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <version>

#ifdef __cpp_lib_format
#include <format>
#endif

#include "vellum/util/function_ref.hpp"
#include "vellum/util/strings.hpp"

#include "vellum/fwd.hpp"
#include "vellum/leaves.hpp"
#include "vellum/render.hpp"
#include "vellum/template_builder.hpp"
#include "vellum/text_sink.hpp"

namespace vellum {

/// @brief A producer made from a function which takes a `Template_Builder&`.
/// This lets markup generators emit ad hoc producers without declaring a named type for every
/// piece of markup.
///
/// The capabilities of a `Renderer` mirror how often its function can be called:
/// - a function that can only be called as an rvalue gives a `render_once_producer`,
/// - a function that can be called as a non-const lvalue gives a `render_mut_producer`,
/// - a function that can be called as a const lvalue gives a `render_producer`.
///
/// For example, a lambda gives a `render_producer`, unless it is `mutable`.
template <typename F>
struct Renderer {
private:
    F m_function;
    std::size_t m_expected_size;

public:
    [[nodiscard]]
    constexpr Renderer(std::size_t expected_size, F function)
        noexcept(std::is_nothrow_move_constructible_v<F>)
        : m_function(std::move(function))
        , m_expected_size { expected_size }
    {
    }

    /// @brief Returns the expected size that this `Renderer` was constructed with.
    [[nodiscard]]
    constexpr std::size_t size_hint() const noexcept
    {
        return m_expected_size;
    }

    constexpr void render_once(Template_Builder& out) &&
        requires std::invocable<F, Template_Builder&>
    {
        std::invoke(std::move(m_function), out);
    }

    constexpr void render_mut(Template_Builder& out)
        requires std::invocable<F&, Template_Builder&>
    {
        std::invoke(m_function, out);
    }

    constexpr void render(Template_Builder& out) const
        requires std::invocable<const F&, Template_Builder&>
    {
        std::invoke(m_function, out);
    }
};

/// @brief Creates a `Renderer` by value.
template <typename F>
[[nodiscard]]
constexpr Renderer<std::decay_t<F>> make_renderer(std::size_t expected_size, F&& function)
{
    return { expected_size, std::forward<F>(function) };
}

/// @brief Creates a `Renderer` on the heap.
/// This is useful when the concrete type is to be hidden later, or when many renderers of
/// different sizes are stored together.
template <typename F>
[[nodiscard]]
std::unique_ptr<Renderer<std::decay_t<F>>>
make_boxed_renderer(std::size_t expected_size, F&& function)
{
    return std::make_unique<Renderer<std::decay_t<F>>>(expected_size, std::forward<F>(function));
}

/// @brief Writes a `Renderer` into a stream, without any intermediate buffer.
/// If the stream fails, rendering stops, and the failure remains visible in the stream state.
template <typename F>
    requires render_producer<Renderer<F>>
std::ostream& operator<<(std::ostream& out, const Renderer<F>& renderer)
{
    Ostream_Text_Sink sink { out };
    Template_Builder builder { sink };
    Producer_Traits<Renderer<F>>::render(renderer, builder);
    return out;
}

} // namespace vellum

#ifdef __cpp_lib_format

namespace std {

/// @brief Lets a `Renderer` be used with `std::format`.
/// All writes are forwarded to the format output iterator directly.
template <typename F>
    requires vellum::render_producer<vellum::Renderer<F>>
struct formatter<vellum::Renderer<F>, char> {
    constexpr format_parse_context::iterator parse(format_parse_context& context)
    {
        return context.begin();
    }

    template <typename Context>
    typename Context::iterator format(const vellum::Renderer<F>& renderer, Context& context) const
    {
        struct State {
            typename Context::iterator out;
        };
        State state { context.out() };

        constexpr auto write = [](State* state, std::u8string_view str) -> bool {
            state->out = std::ranges::copy(vellum::as_string_view(str), state->out).out;
            return true;
        };
        vellum::Function_Text_Sink sink { { vellum::const_v<write>, &state } };
        vellum::Template_Builder builder { sink };
        vellum::Producer_Traits<vellum::Renderer<F>>::render(renderer, builder);
        return state.out;
    }
};

} // namespace std

#endif

#endif
