#ifndef VELLUM_TEMPLATE_BUILDER_HPP
#define VELLUM_TEMPLATE_BUILDER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "vellum/util/assert.hpp"

#include "vellum/fwd.hpp"
#include "vellum/render.hpp"
#include "vellum/services.hpp"
#include "vellum/settings.hpp"
#include "vellum/text_sink.hpp"
#include "vellum/vellum.h"

namespace vellum {

enum struct Render_Error_Code : Default_Underlying {
    /// @brief The text sink refused a write.
    write = VELLUM_RENDER_ERROR_WRITE,
    /// @brief A producer reported an error through `Template_Builder::record_error`.
    producer = VELLUM_RENDER_ERROR_PRODUCER,
};

[[nodiscard]]
constexpr std::u8string_view render_error_code_name(Render_Error_Code code)
{
    using enum Render_Error_Code;
    switch (code) {
        VELLUM_ENUM_STRING_CASE8(write);
        VELLUM_ENUM_STRING_CASE8(producer);
    }
    VELLUM_ASSERT_UNREACHABLE(u8"Invalid error code.");
}

/// @brief The first error that occurred during rendering.
struct Render_Error {
    Render_Error_Code code;
    std::u8string message;

    [[nodiscard]]
    friend bool operator==(const Render_Error&, const Render_Error&)
        = default;
};

struct Render_Options {
    /// @brief Receives diagnostics about failed writes, producer errors,
    /// and clamped size hints.
    Logger& logger = ignorant_logger;
    /// @brief The greatest amount of code units that `Template_Builder::reserve` forwards to
    /// the sink.
    std::size_t max_reservation = default_max_reservation;
};

/// @brief The sink that producers render into.
/// Text is written either escaped (`write_escaped`), where code units with special meaning
/// in HTML are replaced with character references, or raw (`write_raw`), unchanged.
///
/// The builder never fails by itself.
/// When the underlying `Text_Sink` refuses a write or a producer calls `record_error`,
/// the first such error is kept, and every subsequent write is discarded.
/// Exceptions thrown by the sink are not caught.
struct Template_Builder {
private:
    Text_Sink& m_sink;
    Logger& m_logger;
    std::size_t m_max_reservation;
    std::optional<Render_Error> m_error;

public:
    [[nodiscard]]
    explicit Template_Builder(Text_Sink& sink, const Render_Options& options = {})
        : m_sink { sink }
        , m_logger { options.logger }
        , m_max_reservation { options.max_reservation }
    {
    }

    Template_Builder(const Template_Builder&) = delete;
    Template_Builder& operator=(const Template_Builder&) = delete;

    /// @brief Appends `text` unchanged.
    ///
    /// WARNING: Improper use of this function can easily result in incorrect HTML output.
    VELLUM_HOT
    void write_raw(std::u8string_view text);

    /// @brief Appends `text`, where `&`, `<`, `>`, and `"` are replaced with character
    /// references.
    VELLUM_HOT
    void write_escaped(std::u8string_view text);
    void write_escaped(char8_t c);

    /// @brief Records an error on behalf of a producer.
    /// If no error has been recorded yet, this error becomes the result of rendering,
    /// and all further writes are discarded.
    void record_error(std::u8string_view message);

    /// @brief Forwards a size hint to the sink so that it can preallocate.
    /// Hints greater than the maximum reservation are clamped.
    void reserve(std::size_t size_hint);

    /// @brief Returns `true` iff an error has occurred.
    [[nodiscard]]
    bool failed() const noexcept
    {
        return m_error.has_value();
    }

    [[nodiscard]]
    const std::optional<Render_Error>& error() const& noexcept
    {
        return m_error;
    }

    [[nodiscard]]
    std::optional<Render_Error>&& error() && noexcept
    {
        return std::move(m_error);
    }

    /// @brief Renders a producer.
    /// Rvalues are consumed, whereas lvalues are rendered through `Const_Ref` or `Mut_Ref`,
    /// leaving them usable.
    template <typename P>
        requires(!std::convertible_to<P &&, std::u8string_view>)
    Template_Builder& operator<<(P&& producer)
    {
        auto&& once = as_render_once(std::forward<P>(producer));
        using Once = std::remove_cvref_t<decltype(once)>;
        Producer_Traits<Once>::render_once(std::move(once), *this);
        return *this;
    }

    Template_Builder& operator<<(std::u8string_view text)
    {
        write_escaped(text);
        return *this;
    }

    /// @brief Writes a null-terminated string escaped.
    /// A null pointer writes nothing.
    Template_Builder& operator<<(const char8_t* text)
    {
        if (text) {
            write_escaped(std::u8string_view(text));
        }
        return *this;
    }

private:
    void fail(Render_Error_Code code, std::u8string_view id, std::u8string_view message);
};

} // namespace vellum

#endif
