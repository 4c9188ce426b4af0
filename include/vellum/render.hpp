#ifndef VELLUM_RENDER_HPP
#define VELLUM_RENDER_HPP

#include <concepts>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "vellum/fwd.hpp"

namespace vellum {

// A producer is anything that can write a representation of itself into a `Template_Builder`.
// There are three capability tiers, each a strict superset of the previous one:
//
//   render_once_producer: std::move(p) is rendered exactly once, consuming p
//   render_mut_producer:  p is rendered through a non-const lvalue, any number of times
//   render_producer:      p is rendered through a const lvalue, any number of times
//
// All operations are reached through `Producer_Traits`,
// so that types which cannot have member functions (std::u8string_view, integers, ...)
// can be producers as well.

namespace detail {

template <typename T>
concept has_member_size_hint = requires(const T& self) {
    { self.size_hint() } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept has_member_render_once = requires(T&& self, Template_Builder& out) {
    std::move(self).render_once(out);
};

template <typename T>
concept has_member_render_mut = requires(T& self, Template_Builder& out) {
    self.render_mut(out);
};

template <typename T>
concept has_member_render = requires(const T& self, Template_Builder& out) {
    self.render(out);
};

} // namespace detail

/// @brief Customization point for producers.
/// The primary template forwards to member functions `render_once() &&`,
/// `render_mut()`, `render() const`, and `size_hint() const`.
///
/// A weaker operation falls back onto a stronger member function when the weaker one is absent.
/// For example, a type which only has `render() const` can also be rendered through
/// `render_mut` and `render_once`.
template <typename T>
struct Producer_Traits {
    [[nodiscard]]
    static constexpr std::size_t size_hint(const T& self)
    {
        if constexpr (detail::has_member_size_hint<T>) {
            return self.size_hint();
        }
        else {
            return 0;
        }
    }

    static constexpr void render_once(T&& self, Template_Builder& out)
        requires detail::has_member_render_once<T> || detail::has_member_render_mut<T>
        || detail::has_member_render<T>
    {
        if constexpr (detail::has_member_render_once<T>) {
            std::move(self).render_once(out);
        }
        else if constexpr (detail::has_member_render_mut<T>) {
            self.render_mut(out);
        }
        else {
            std::as_const(self).render(out);
        }
    }

    static constexpr void render_mut(T& self, Template_Builder& out)
        requires detail::has_member_render_mut<T> || detail::has_member_render<T>
    {
        if constexpr (detail::has_member_render_mut<T>) {
            self.render_mut(out);
        }
        else {
            std::as_const(self).render(out);
        }
    }

    static constexpr void render(const T& self, Template_Builder& out)
        requires detail::has_member_render<T>
    {
        self.render(out);
    }
};

/// @brief Something that can be rendered once.
/// Rendering consumes the producer; it shall not be used afterwards.
template <typename T>
concept render_once_producer = std::is_object_v<T> && !std::is_const_v<T>
    && requires(T&& self, const T& cself, Template_Builder& out) {
           { Producer_Traits<T>::size_hint(cself) } -> std::same_as<std::size_t>;
           Producer_Traits<T>::render_once(std::move(self), out);
       };

/// @brief Something that can be rendered through exclusive access, any number of times.
template <typename T>
concept render_mut_producer = render_once_producer<T> && requires(T& self, Template_Builder& out) {
    Producer_Traits<T>::render_mut(self, out);
};

/// @brief Something that can be rendered through shared access, any number of times,
/// without modifying the producer.
template <typename T>
concept render_producer
    = render_mut_producer<T> && requires(const T& self, Template_Builder& out) {
          Producer_Traits<T>::render(self, out);
      };

/// @brief Returns a rough estimate of how many code units rendering `p` writes.
/// The estimate is purely advisory; it never affects the output.
template <typename P>
    requires render_once_producer<std::remove_cvref_t<P>>
[[nodiscard]]
constexpr std::size_t size_hint(const P& p)
{
    return Producer_Traits<std::remove_cvref_t<P>>::size_hint(p);
}

/// @brief Renders `p` exactly once, consuming it.
template <typename P>
    requires render_once_producer<P>
constexpr void render_once(P&& p, Template_Builder& out)
{
    Producer_Traits<P>::render_once(std::move(p), out);
}

template <render_mut_producer P>
constexpr void render_mut(P& p, Template_Builder& out)
{
    Producer_Traits<P>::render_mut(p, out);
}

template <render_producer P>
constexpr void render(const P& p, Template_Builder& out)
{
    Producer_Traits<P>::render(p, out);
}

// FORWARDING ADAPTERS =============================================================================

/// @brief Exclusive reference to a `render_mut_producer`,
/// which is itself a `render_once_producer`.
/// Consuming the reference performs exactly one `render_mut` of the referenced producer,
/// which remains usable afterwards.
template <typename T>
struct Mut_Ref {
    static_assert(render_mut_producer<T>);

private:
    T* m_producer;

public:
    [[nodiscard]]
    constexpr explicit Mut_Ref(T& producer) noexcept
        : m_producer { std::addressof(producer) }
    {
    }

    [[nodiscard]]
    constexpr std::size_t size_hint() const
    {
        return Producer_Traits<T>::size_hint(*m_producer);
    }

    constexpr void render_once(Template_Builder& out) &&
    {
        Producer_Traits<T>::render_mut(*m_producer, out);
    }
};

/// @brief Shared reference to a `render_producer`,
/// which is itself a `render_once_producer`.
/// Consuming the reference performs exactly one `render` of the referenced producer.
template <typename T>
struct Const_Ref {
    static_assert(render_producer<T>);

private:
    const T* m_producer;

public:
    [[nodiscard]]
    constexpr explicit Const_Ref(const T& producer) noexcept
        : m_producer { std::addressof(producer) }
    {
    }

    [[nodiscard]]
    constexpr std::size_t size_hint() const
    {
        return Producer_Traits<T>::size_hint(*m_producer);
    }

    constexpr void render_once(Template_Builder& out) &&
    {
        Producer_Traits<T>::render(*m_producer, out);
    }
};

template <render_mut_producer T>
[[nodiscard]]
constexpr Mut_Ref<T> by_mut(T& producer) noexcept
{
    return Mut_Ref<T> { producer };
}

template <render_producer T>
[[nodiscard]]
constexpr Const_Ref<T> by_ref(const T& producer) noexcept
{
    return Const_Ref<T> { producer };
}

/// @brief Turns any producer expression into something that can be consumed once:
/// rvalues are passed through, lvalues are wrapped in `Const_Ref` if they can be rendered
/// through shared access, and in `Mut_Ref` otherwise.
/// This is what allows the same sub-producer to be rendered from multiple places.
template <typename P>
[[nodiscard]]
constexpr decltype(auto) as_render_once(P&& p) noexcept
{
    using T = std::remove_cvref_t<P>;
    if constexpr (!std::is_lvalue_reference_v<P>) {
        static_assert(render_once_producer<T>, "Rvalue must be a render_once_producer.");
        return std::forward<P>(p);
    }
    else if constexpr (render_producer<T>) {
        return Const_Ref<T> { p };
    }
    else {
        static_assert(
            !std::is_const_v<std::remove_reference_t<P>> && render_mut_producer<T>,
            "Lvalue must be a render_producer, or a non-const render_mut_producer."
        );
        return Mut_Ref<T> { p };
    }
}

// UNIQUE_PTR ======================================================================================

/// @brief A `std::unique_ptr` to a producer has the capabilities of the producer it points to.
/// A null pointer renders nothing.
template <typename T, typename Deleter>
struct Producer_Traits<std::unique_ptr<T, Deleter>> {
    using Self = std::unique_ptr<T, Deleter>;

    [[nodiscard]]
    static constexpr std::size_t size_hint(const Self& self)
    {
        return self ? Producer_Traits<T>::size_hint(*self) : 0;
    }

    static constexpr void render_once(Self&& self, Template_Builder& out)
        requires render_once_producer<T>
    {
        if (self) {
            const Self owner = std::move(self);
            Producer_Traits<T>::render_once(std::move(*owner), out);
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
