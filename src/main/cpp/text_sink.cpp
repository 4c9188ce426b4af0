#include <ios>
#include <ostream>
#include <string_view>

#include "vellum/util/strings.hpp"

#include "vellum/text_sink.hpp"

namespace vellum {

bool Ostream_Text_Sink::write(std::u8string_view str)
{
    const std::string_view chars = as_string_view(str);
    m_out.write(chars.data(), std::streamsize(chars.size()));
    return !m_out.fail();
}

} // namespace vellum
