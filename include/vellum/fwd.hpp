#ifndef VELLUM_FWD_HPP
#define VELLUM_FWD_HPP

namespace vellum {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define VELLUM_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Capturing_Ref_Text_Sink;
template <typename>
struct Const_Ref;
struct Diagnostic;
template <typename>
struct Element;
struct Function_Text_Sink;
struct Ignorant_Logger;
struct Logger;
template <typename>
struct Mut_Ref;
struct Ostream_Text_Sink;
template <typename>
struct Producer_Traits;
template <typename>
struct Raw;
struct Render_Error;
enum struct Render_Error_Code : Default_Underlying;
struct Render_Options;
template <typename>
struct Renderer;
enum struct Severity : Default_Underlying;
struct Template_Builder;
struct Text_Sink;
struct String_Ref_Text_Sink;
struct Vector_Text_Sink;

struct Box_Render;
struct Box_Render_Mut;
struct Box_Render_Once;

} // namespace vellum

#endif
