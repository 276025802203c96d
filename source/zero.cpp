// zero.cpp - Zero-value classification

#include <docupdate/zero.h>

namespace docupdate {

bool is_zero(ValueRef value) {
    const TypeInfo& type = *value.type;

    switch (type.kind) {
        case Kind::String:
        case Kind::Bool:
        case Kind::Int:
        case Kind::Uint:
        case Kind::Float:
        case Kind::Time:
        case Kind::Dynamic:
        case Kind::Raw:
            return type.zero(value.ptr);

        case Kind::Pointer:
            return type.deref(value.ptr) == nullptr;

        case Kind::Sequence:
        case Kind::Map:
            return type.size(value.ptr) == 0;

        case Kind::Record:
            // Hidden fields do not count; fields excluded with "-" still do
            for (const FieldInfo& field : type.fields()) {
                if (!field.exported && !field.anonymous) {
                    continue;
                }
                if (!is_zero(field.ref(value.ptr))) {
                    return false;
                }
            }
            return true;

        case Kind::Func:
        case Kind::Opaque:
            return false;
    }
    return false;
}

} // namespace docupdate
