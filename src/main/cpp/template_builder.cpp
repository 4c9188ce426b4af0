#include <cstddef>
#include <string_view>

#include "vellum/util/assert.hpp"
#include "vellum/util/html.hpp"
#include "vellum/util/severity.hpp"

#include "vellum/diagnostic.hpp"
#include "vellum/services.hpp"
#include "vellum/template_builder.hpp"

namespace vellum {

namespace {

struct Raw_Writer {
    Template_Builder& out;

    void operator()(std::u8string_view str) const
    {
        out.write_raw(str);
    }
    void operator()(char8_t c) const
    {
        out.write_raw({ &c, 1 });
    }
};

} // namespace

void Template_Builder::write_raw(std::u8string_view text)
{
    if (m_error || text.empty()) {
        return;
    }
    if (!m_sink.write(text)) {
        fail(
            Render_Error_Code::write, diagnostic::write_failed,
            u8"The text sink refused a write. Any further output is discarded."
        );
    }
}

void Template_Builder::write_escaped(std::u8string_view text)
{
    Raw_Writer writer { *this };
    append_html_escaped_of(writer, text, html_text_escape_charset);
}

void Template_Builder::write_escaped(char8_t c)
{
    write_escaped({ &c, 1 });
}

void Template_Builder::record_error(std::u8string_view message)
{
    fail(Render_Error_Code::producer, diagnostic::render_error, message);
}

void Template_Builder::reserve(std::size_t size_hint)
{
    if (m_error || size_hint == 0) {
        return;
    }
    if (size_hint > m_max_reservation) {
        if (m_logger.can_log(Severity::soft_warning)) {
            m_logger(
                { Severity::soft_warning, diagnostic::size_hint_clamped,
                  u8"A size hint exceeded the maximum reservation and was clamped." }
            );
        }
        size_hint = m_max_reservation;
    }
    m_sink.reserve(size_hint);
}

void Template_Builder::fail(
    Render_Error_Code code,
    std::u8string_view id,
    std::u8string_view message
)
{
    if (m_error) {
        return;
    }
    m_error = Render_Error { code, std::u8string { message } };
    if (m_logger.can_log(Severity::error)) {
        m_logger({ Severity::error, id, message });
    }
}

} // namespace vellum
