#ifndef VELLUM_TEXT_SINK_HPP
#define VELLUM_TEXT_SINK_HPP

#include <cstddef>
#include <iosfwd>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "vellum/util/function_ref.hpp"
#include "vellum/util/strings.hpp"

#include "vellum/fwd.hpp"

namespace vellum {

/// @brief The destination of all rendered text.
/// A sink receives text which has already been escaped where necessary;
/// it never transforms what it is given.
struct Text_Sink {
    /// @brief Appends `str`.
    /// @returns `true` iff the text was accepted.
    /// Once a write has been refused, the `Template_Builder` using this sink stops writing.
    virtual bool write(std::u8string_view str) = 0;

    /// @brief Informs the sink that approximately `amount` more code units are about to
    /// be written.
    /// This is purely advisory and has no effect on the written text.
    virtual void reserve([[maybe_unused]] std::size_t amount) { }
};

/// @brief Text sink which appends to a `std::pmr::vector` owned by somebody else.
struct Capturing_Ref_Text_Sink final : Text_Sink {
private:
    std::pmr::vector<char8_t>& m_out;

public:
    [[nodiscard]]
    explicit Capturing_Ref_Text_Sink(std::pmr::vector<char8_t>& out)
        : m_out { out }
    {
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>& operator*() &
    {
        return m_out;
    }

    bool write(std::u8string_view str) override
    {
        append(m_out, str);
        return true;
    }

    void reserve(std::size_t amount) override
    {
        m_out.reserve(m_out.size() + amount);
    }
};

/// @brief Text sink which appends to a `std::pmr::u8string` owned by somebody else.
struct String_Ref_Text_Sink final : Text_Sink {
private:
    std::pmr::u8string& m_out;

public:
    [[nodiscard]]
    explicit String_Ref_Text_Sink(std::pmr::u8string& out)
        : m_out { out }
    {
    }

    bool write(std::u8string_view str) override
    {
        append(m_out, str);
        return true;
    }

    void reserve(std::size_t amount) override
    {
        m_out.reserve(m_out.size() + amount);
    }
};

/// @brief Text sink which collects all output in a `std::pmr::vector`.
struct Vector_Text_Sink final : Text_Sink {
private:
    std::pmr::vector<char8_t> m_out;

public:
    [[nodiscard]]
    explicit Vector_Text_Sink(std::pmr::memory_resource* memory)
        : m_out { memory }
    {
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>& operator*() &
    {
        return m_out;
    }

    [[nodiscard]]
    const std::pmr::vector<char8_t>& operator*() const&
    {
        return m_out;
    }

    /// @brief Returns a view of everything written so far.
    [[nodiscard]]
    std::u8string_view str() const noexcept
    {
        return as_u8string_view(m_out);
    }

    bool write(std::u8string_view str) override
    {
        append(m_out, str);
        return true;
    }

    void reserve(std::size_t amount) override
    {
        m_out.reserve(m_out.size() + amount);
    }
};

/// @brief Text sink which forwards every write to a `std::ostream`, without buffering.
/// A write is refused once the stream has failed.
struct Ostream_Text_Sink final : Text_Sink {
private:
    std::ostream& m_out;

public:
    [[nodiscard]]
    explicit Ostream_Text_Sink(std::ostream& out)
        : m_out { out }
    {
    }

    bool write(std::u8string_view str) override;
};

/// @brief Text sink which forwards every write to a function.
/// The function returns `false` to refuse a write.
struct Function_Text_Sink final : Text_Sink {
private:
    Function_Ref<bool(std::u8string_view)> m_write;

public:
    [[nodiscard]]
    explicit Function_Text_Sink(Function_Ref<bool(std::u8string_view)> write)
        : m_write { write }
    {
    }

    bool write(std::u8string_view str) override
    {
        return m_write(str);
    }
};

} // namespace vellum

#endif
