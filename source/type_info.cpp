// type_info.cpp - Kind names for the runtime type model

#include <docupdate/type_info.h>

namespace docupdate {

std::string_view to_string(Kind kind) noexcept
{
    switch (kind) {
        case Kind::String:   return "string";
        case Kind::Bool:     return "bool";
        case Kind::Int:      return "int";
        case Kind::Uint:     return "uint";
        case Kind::Float:    return "float";
        case Kind::Time:     return "time";
        case Kind::Pointer:  return "pointer";
        case Kind::Sequence: return "sequence";
        case Kind::Map:      return "map";
        case Kind::Record:   return "record";
        case Kind::Dynamic:  return "value";
        case Kind::Raw:      return "raw";
        case Kind::Func:     return "func";
        case Kind::Opaque:   return "opaque";
    }
    return "unknown";
}

} // namespace docupdate
