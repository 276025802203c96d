// update.cpp - Update document construction

#include <docupdate/update.h>
#include <docupdate/builders.h>
#include <docupdate/document.h>
#include <docupdate/errors.h>
#include <docupdate/serialization.h>
#include <docupdate/struct_info.h>
#include <docupdate/zero.h>

#include <type_traits>
#include <variant>
#include <vector>

namespace docupdate {

namespace {

// ============================================================
// Input shapes
// ============================================================

/// Pre-encoded document
struct RawShape {
    const RawValue* raw;
};

/// Typed map, or a Value holding a map
struct MappingShape {
    ValueRef source;
};

struct RecordShape {
    ValueRef source;
};

/// Anything else: encoded as a document first
struct OtherShape {
    ValueRef source;
};

using Shape = std::variant<RawShape, MappingShape, RecordShape, OtherShape>;

// Apply hooks and dereference pointers until neither applies. Hook results
// are kept alive in `held` for as long as the resolved reference is used.
ValueRef resolve(ValueRef value, std::vector<Boxed>& held) {
    for (;;) {
        const TypeInfo& type = *value.type;
        if (type.represent) {
            held.push_back(represent(value));
            value = held.back().ref();
            continue;
        }
        if (type.kind == Kind::Pointer) {
            const void* target = type.deref(value.ptr);
            if (!target) {
                throw MarshalError("nil pointer");
            }
            value = ValueRef{&type.elem(), target};
            continue;
        }
        return value;
    }
}

Shape classify(ValueRef value) {
    switch (value.type->kind) {
        case Kind::Raw:
            return RawShape{&detail::as<RawValue>(value.ptr)};
        case Kind::Dynamic: {
            const Value& dynamic = detail::as<Value>(value.ptr);
            if (auto* raw = dynamic.get_if<RawValue>()) {
                return RawShape{raw};
            }
            if (dynamic.is_map()) {
                return MappingShape{value};
            }
            return OtherShape{value};
        }
        case Kind::Map:
            return MappingShape{value};
        case Kind::Record:
            return RecordShape{value};
        default:
            return OtherShape{value};
    }
}

const std::string& identity() {
    static const std::string key{identity_key};
    return key;
}

Update fields_update(const ValueMap& fields) {
    Update u;
    u.set = fields.erase(identity());
    return u;
}

Update document_update(const Value& document) {
    return fields_update(unmarshal_fields(marshal_document(document)));
}

Update mapping_update(ValueRef mapping) {
    const TypeInfo& type = *mapping.type;
    if (type.kind == Kind::Dynamic) {
        return fields_update(*detail::as<Value>(mapping.ptr).get_if<ValueMap>());
    }
    if (type.key().kind != Kind::String) {
        throw ShapeError("map key not a string");
    }

    MapBuilder set;
    type.for_each(mapping.ptr, [&set](ValueRef key, ValueRef value) {
        std::string name{key.type->text(key.ptr)};
        if (name == identity_key) {
            return;
        }
        set.set(name, to_value(value));
    });
    return Update{set.finish_map(), ValueMap{}};
}

Update record_update(ValueRef record) {
    auto info = describe(*record.type);
    MapBuilder set;
    MapBuilder unset;

    if (info->has_inline_map()) {
        ValueRef extra = inline_map_ref(*info, record.ptr);
        extra.type->for_each(extra.ptr, [&](ValueRef key, ValueRef value) {
            std::string name{key.type->text(key.ptr)};
            if (info->find(name)) {
                throw ConflictError("Can't have key \"" + name +
                                    "\" in inlined map; conflicts with struct field");
            }
            if (name == identity_key) {
                return;
            }
            set.set(name, to_value(value));
        });
    }

    for (const FieldDescriptor& field : info->fields_list) {
        if (field.key == identity_key) {
            continue;
        }
        ValueRef member = field_ref(*info, field, record.ptr);
        if (field.omit_empty && is_zero(member)) {
            unset.set(field.key, Value{});
        } else {
            set.set(field.key, to_value(member));
        }
    }
    return Update{set.finish_map(), unset.finish_map()};
}

} // anonymous namespace

Value Update::to_value() const {
    MapBuilder doc;
    if (!set.empty()) {
        doc.set("$set", Value{set});
    }
    if (!unset.empty()) {
        doc.set("$unset", Value{unset});
    }
    return doc.finish();
}

Update as_update(ValueRef value) {
    std::vector<Boxed> held;
    ValueRef resolved = resolve(value, held);

    return std::visit([](const auto& shape) -> Update {
        using S = std::decay_t<decltype(shape)>;

        if constexpr (std::is_same_v<S, RawShape>) {
            return document_update(Value{*shape.raw});
        } else if constexpr (std::is_same_v<S, MappingShape>) {
            return mapping_update(shape.source);
        } else if constexpr (std::is_same_v<S, RecordShape>) {
            return record_update(shape.source);
        } else {
            return document_update(to_value(shape.source));
        }
    }, classify(resolved));
}

Update as_update(const Boxed& value) {
    return as_update(value.ref());
}

} // namespace docupdate
