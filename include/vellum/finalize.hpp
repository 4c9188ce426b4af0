#ifndef VELLUM_FINALIZE_HPP
#define VELLUM_FINALIZE_HPP

#include <concepts>
#include <cstddef>
#include <expected>
#include <memory_resource>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "vellum/fwd.hpp"
#include "vellum/leaves.hpp"
#include "vellum/render.hpp"
#include "vellum/template_builder.hpp"
#include "vellum/text_sink.hpp"

namespace vellum {

namespace detail {

template <typename P>
[[nodiscard]]
constexpr std::size_t root_size_hint(const P& producer)
{
    using T = std::decay_t<const P>;
    if constexpr (render_once_producer<T>) {
        return Producer_Traits<T>::size_hint(producer);
    }
    else {
        return std::u8string_view(producer).size();
    }
}

} // namespace detail

/// @brief Renders a root producer into `sink`.
/// The producer's size hint is forwarded to the sink first so that it can preallocate.
/// Lvalues are rendered by reference and remain usable; rvalues are consumed.
/// @returns The first error that occurred, if any.
template <typename P>
[[nodiscard]]
std::expected<void, Render_Error>
render_to(Text_Sink& sink, P&& producer, const Render_Options& options = {})
{
    Template_Builder builder { sink, options };
    builder.reserve(detail::root_size_hint(producer));
    builder << std::forward<P>(producer);
    if (builder.failed()) {
        return std::unexpected { *std::move(builder).error() };
    }
    return {};
}

/// @brief Renders a root producer into a new string.
template <typename P>
[[nodiscard]]
std::expected<std::pmr::u8string, Render_Error> render_to_string(
    P&& producer,
    std::pmr::memory_resource* memory = std::pmr::get_default_resource(),
    const Render_Options& options = {}
)
{
    std::pmr::u8string result { memory };
    String_Ref_Text_Sink sink { result };
    if (auto status = render_to(sink, std::forward<P>(producer), options); !status) {
        return std::unexpected { std::move(status).error() };
    }
    return result;
}

/// @brief Renders a root producer into a stream, without buffering.
template <typename P>
[[nodiscard]]
std::expected<void, Render_Error>
render_to_stream(std::ostream& out, P&& producer, const Render_Options& options = {})
{
    Ostream_Text_Sink sink { out };
    return render_to(sink, std::forward<P>(producer), options);
}

} // namespace vellum

#endif
