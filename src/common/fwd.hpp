#ifndef DOCPRESS_COMMON_FWD_HPP
#define DOCPRESS_COMMON_FWD_HPP

#include "common/config.hpp"

namespace docpress {

enum struct Code_Span_Type : Default_Underlying;
enum struct Severity : Default_Underlying;
enum struct Node_Kind : Default_Underlying;
enum struct Node_Id : Uint32;
enum struct Config_Error_Code : Default_Underlying;
enum struct IO_Error_Code : Default_Underlying;

struct Assertion_Error;
struct Code_String;
struct Condition;
struct Config_Error;
struct Diagnostic;
struct Document;
struct Settings;
struct Transform_Halt;
struct Visitor_Condition;

} // namespace docpress

#endif
