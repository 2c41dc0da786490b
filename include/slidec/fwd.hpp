#ifndef SLIDEC_FWD_HPP
#define SLIDEC_FWD_HPP

#include "slidec/settings.hpp"

SLIDEC_IF_DEBUG() // silence unused warning for settings.hpp

namespace slidec {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define SLIDEC_ENUM_STRING_CASE(...)                                                               \
    case __VA_ARGS__: return #__VA_ARGS__

#define SLIDEC_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Argument_Error;
enum struct Argument_Error_Kind : Default_Underlying;
enum struct Attribute_Style : Default_Underlying;
struct Attribute_Writer;
struct Background;
struct Background_View;
struct Caption;
struct Caption_View;
struct Capturing_Ref_Text_Sink;
struct Classified_Line;
struct Code;
struct Code_View;
struct Collected_Diagnostic;
struct Collecting_Logger;
struct Diagnostic;
struct Directive_Argument;
enum struct Directive_Kind : Default_Underlying;
struct Document;
struct Document_Builder;
enum struct Element_Kind : Default_Underlying;
struct Fence_Marker;
enum struct Fence_Marker_Kind : Default_Underlying;
struct Generation_Options;
enum struct Generation_Status : Default_Underlying;
enum struct Heading_Policy : Default_Underlying;
struct HTML;
struct HTML_Writer;
struct HTML_View;
struct Iframe;
struct Iframe_View;
struct Ignorant_Logger;
struct Image;
struct Image_View;
struct Lex_Options;
enum struct Line_Kind : Default_Underlying;
struct Line_Reader;
struct Link;
struct Link_View;
struct List;
struct List_View;
struct Logger;
struct No_Support_Play_Service;
enum struct Node_Kind : Default_Underlying;
enum struct Parse_Action : Default_Underlying;
struct Parse_Error;
enum struct Parse_Error_Kind : Default_Underlying;
struct Parse_Options;
enum struct Parse_State : Default_Underlying;
struct Play_Service;
struct Reg_Exp;
enum struct Reg_Exp_Error_Code : Default_Underlying;
enum struct Reg_Exp_Status : Default_Underlying;
struct Render_Config_Error;
struct Render_Context;
template <typename View>
struct Render_Rule;
struct Render_Rule_Set;
template <typename T, typename E>
struct Result;
struct Section;
struct Section_View;
enum struct Severity : Default_Underlying;
struct Source_Line;
struct Source_Position;
struct Source_Span;
struct Stream_Logger;
struct Style_Fragment;
enum struct Style_Kind : Default_Underlying;
struct Text;
struct Text_Sink;
struct Text_View;
struct Vector_Text_Sink;
struct Video;
struct Video_View;

} // namespace slidec

#endif
