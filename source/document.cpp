// document.cpp - Typed value to Value conversion

#include <docupdate/document.h>
#include <docupdate/builders.h>
#include <docupdate/errors.h>
#include <docupdate/struct_info.h>
#include <docupdate/zero.h>

#include <exception>

namespace docupdate {

namespace {

std::string key_text(ValueRef key) {
    return std::string{key.type->text(key.ptr)};
}

Value record_to_value(ValueRef record) {
    auto info = describe(*record.type);
    MapBuilder doc;

    for (const FieldDescriptor& field : info->fields_list) {
        ValueRef member = field_ref(*info, field, record.ptr);
        if (field.omit_empty && is_zero(member)) {
            continue;
        }
        doc.set(field.key, to_value(member));
    }

    if (info->has_inline_map()) {
        ValueRef extra = inline_map_ref(*info, record.ptr);
        extra.type->for_each(extra.ptr, [&](ValueRef key, ValueRef value) {
            std::string name = key_text(key);
            if (info->find(name)) {
                throw ConflictError("Can't have key \"" + name +
                                    "\" in inlined map; conflicts with struct field");
            }
            doc.set(name, to_value(value));
        });
    }
    return doc.finish();
}

Value map_to_value(ValueRef map) {
    const TypeInfo& type = *map.type;
    if (type.key().kind != Kind::String) {
        throw ShapeError("map key not a string");
    }
    MapBuilder doc;
    type.for_each(map.ptr, [&doc](ValueRef key, ValueRef value) {
        doc.set(key_text(key), to_value(value));
    });
    return doc.finish();
}

Value sequence_to_value(ValueRef seq) {
    VectorBuilder items;
    seq.type->for_each(seq.ptr, [&items](ValueRef, ValueRef value) {
        items.push_back(to_value(value));
    });
    return items.finish();
}

} // anonymous namespace

Boxed represent(ValueRef value) {
    try {
        return value.type->represent(value.ptr);
    } catch (const std::exception& e) {
        throw RepresentationError(e.what());
    }
}

Value to_value(ValueRef value) {
    const TypeInfo& type = *value.type;

    if (type.represent) {
        Boxed replacement = represent(value);
        return to_value(replacement.ref());
    }

    switch (type.kind) {
        case Kind::String:
        case Kind::Bool:
        case Kind::Int:
        case Kind::Uint:
        case Kind::Float:
        case Kind::Time:
        case Kind::Dynamic:
        case Kind::Raw:
            return type.scalar(value.ptr);

        case Kind::Pointer:
            if (const void* target = type.deref(value.ptr)) {
                return to_value(ValueRef{&type.elem(), target});
            }
            return Value{};

        case Kind::Sequence:
            return sequence_to_value(value);

        case Kind::Map:
            return map_to_value(value);

        case Kind::Record:
            return record_to_value(value);

        case Kind::Func:
        case Kind::Opaque:
            break;
    }
    throw MarshalError("can't marshal " + std::string(type.name));
}

} // namespace docupdate
