#ifndef VELLUM_BOXED_HPP
#define VELLUM_BOXED_HPP

#include <concepts>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "vellum/fwd.hpp"
#include "vellum/leaves.hpp"
#include "vellum/render.hpp"
#include "vellum/template_builder.hpp"

namespace vellum {

// Handles which hide the concrete type of a producer behind one capability tier.
// They own the producer on the heap and add no buffering or transformation.
// A moved-from or spent handle renders nothing.

namespace detail {

/// @brief The form in which any `render_once_producer` can be rendered out of a box.
struct Render_Once_Interface {
    virtual ~Render_Once_Interface() = default;

    /// @brief Renders the boxed producer exactly once, consuming it.
    /// The box is destroyed by the caller afterwards.
    virtual void render_box(Template_Builder& out) = 0;
    [[nodiscard]]
    virtual std::size_t size_hint_box() const
        = 0;
};

struct Render_Mut_Interface {
    virtual ~Render_Mut_Interface() = default;

    virtual void render_mut(Template_Builder& out) = 0;
    [[nodiscard]]
    virtual std::size_t size_hint() const
        = 0;
};

struct Render_Interface {
    virtual ~Render_Interface() = default;

    virtual void render(Template_Builder& out) const = 0;
    [[nodiscard]]
    virtual std::size_t size_hint() const
        = 0;
};

template <render_once_producer T>
struct Render_Once_Model final : Render_Once_Interface {
    T producer;

    template <typename... Args>
    [[nodiscard]]
    explicit Render_Once_Model(Args&&... args)
        : producer(std::forward<Args>(args)...)
    {
    }

    void render_box(Template_Builder& out) final
    {
        Producer_Traits<T>::render_once(std::move(producer), out);
    }

    [[nodiscard]]
    std::size_t size_hint_box() const final
    {
        return Producer_Traits<T>::size_hint(producer);
    }
};

template <render_mut_producer T>
struct Render_Mut_Model final : Render_Mut_Interface {
    T producer;

    template <typename... Args>
    [[nodiscard]]
    explicit Render_Mut_Model(Args&&... args)
        : producer(std::forward<Args>(args)...)
    {
    }

    void render_mut(Template_Builder& out) final
    {
        Producer_Traits<T>::render_mut(producer, out);
    }

    [[nodiscard]]
    std::size_t size_hint() const final
    {
        return Producer_Traits<T>::size_hint(producer);
    }
};

template <render_producer T>
struct Render_Model final : Render_Interface {
    T producer;

    template <typename... Args>
    [[nodiscard]]
    explicit Render_Model(Args&&... args)
        : producer(std::forward<Args>(args)...)
    {
    }

    void render(Template_Builder& out) const final
    {
        Producer_Traits<T>::render(producer, out);
    }

    [[nodiscard]]
    std::size_t size_hint() const final
    {
        return Producer_Traits<T>::size_hint(producer);
    }
};

/// @brief The type stored for a producer expression of type `P`.
/// String literals are stored as pointers.
template <typename P>
using Boxed_Type = std::decay_t<P>;

} // namespace detail

/// @brief Handle to a boxed producer which can only be rendered once.
struct Box_Render_Once {
private:
    std::unique_ptr<detail::Render_Once_Interface> m_box;

public:
    [[nodiscard]]
    Box_Render_Once() noexcept
        = default;

    template <typename P>
        requires(!std::same_as<std::remove_cvref_t<P>, Box_Render_Once>)
        && render_once_producer<detail::Boxed_Type<P>>
    [[nodiscard]]
    Box_Render_Once(P&& producer) // NOLINT(google-explicit-constructor)
        : m_box { std::make_unique<detail::Render_Once_Model<detail::Boxed_Type<P>>>(
              std::forward<P>(producer)
          ) }
    {
    }

    [[nodiscard]]
    Box_Render_Once(Box_Render_Once&&) noexcept
        = default;
    Box_Render_Once& operator=(Box_Render_Once&&) noexcept = default;

    /// @brief Returns `true` iff the handle owns a producer.
    [[nodiscard]]
    explicit operator bool() const noexcept
    {
        return m_box != nullptr;
    }

    [[nodiscard]]
    std::size_t size_hint() const
    {
        return m_box ? m_box->size_hint_box() : 0;
    }

    /// @brief Renders the boxed producer and frees it.
    void render_once(Template_Builder& out) &&
    {
        if (const auto box = std::move(m_box)) {
            box->render_box(out);
        }
    }
};

/// @brief Handle to a boxed producer which can be rendered through exclusive access,
/// any number of times.
/// Consuming the handle performs one last `render_mut` and frees the producer.
struct Box_Render_Mut {
private:
    std::unique_ptr<detail::Render_Mut_Interface> m_box;

public:
    [[nodiscard]]
    Box_Render_Mut() noexcept
        = default;

    template <typename P>
        requires(!std::same_as<std::remove_cvref_t<P>, Box_Render_Mut>)
        && render_mut_producer<detail::Boxed_Type<P>>
    [[nodiscard]]
    Box_Render_Mut(P&& producer) // NOLINT(google-explicit-constructor)
        : m_box { std::make_unique<detail::Render_Mut_Model<detail::Boxed_Type<P>>>(
              std::forward<P>(producer)
          ) }
    {
    }

    [[nodiscard]]
    Box_Render_Mut(Box_Render_Mut&&) noexcept
        = default;
    Box_Render_Mut& operator=(Box_Render_Mut&&) noexcept = default;

    [[nodiscard]]
    explicit operator bool() const noexcept
    {
        return m_box != nullptr;
    }

    [[nodiscard]]
    std::size_t size_hint() const
    {
        return m_box ? m_box->size_hint() : 0;
    }

    void render_mut(Template_Builder& out)
    {
        if (m_box) {
            m_box->render_mut(out);
        }
    }

    void render_once(Template_Builder& out) &&
    {
        if (const auto box = std::move(m_box)) {
            box->render_mut(out);
        }
    }
};

/// @brief Handle to a boxed producer which can be rendered through shared access,
/// any number of times.
struct Box_Render {
private:
    std::unique_ptr<const detail::Render_Interface> m_box;

public:
    [[nodiscard]]
    Box_Render() noexcept
        = default;

    template <typename P>
        requires(!std::same_as<std::remove_cvref_t<P>, Box_Render>)
        && render_producer<detail::Boxed_Type<P>>
    [[nodiscard]]
    Box_Render(P&& producer) // NOLINT(google-explicit-constructor)
        : m_box { std::make_unique<detail::Render_Model<detail::Boxed_Type<P>>>(
              std::forward<P>(producer)
          ) }
    {
    }

    [[nodiscard]]
    Box_Render(Box_Render&&) noexcept
        = default;
    Box_Render& operator=(Box_Render&&) noexcept = default;

    [[nodiscard]]
    explicit operator bool() const noexcept
    {
        return m_box != nullptr;
    }

    [[nodiscard]]
    std::size_t size_hint() const
    {
        return m_box ? m_box->size_hint() : 0;
    }

    void render(Template_Builder& out) const
    {
        if (m_box) {
            m_box->render(out);
        }
    }

    void render_mut(Template_Builder& out)
    {
        render(out);
    }

    void render_once(Template_Builder& out) &&
    {
        if (const auto box = std::move(m_box)) {
            box->render(out);
        }
    }
};

} // namespace vellum

#endif
