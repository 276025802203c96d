// serialization.cpp - Binary encoding of Value and document roots

#include <docupdate/serialization.h>
#include <docupdate/builders.h>
#include <docupdate/errors.h>

#include <bit>        // for std::endian
#include <cstring>    // for std::memcpy
#include <stdexcept>  // for std::runtime_error

namespace docupdate {

namespace {

static_assert(std::endian::native == std::endian::little,
              "the binary format is written in host byte order");

// Helper: write bytes to buffer
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(uint8_t v) {
        buffer.push_back(v);
    }

    void write_tag(TypeTag tag) {
        write_u8(static_cast<uint8_t>(tag));
    }

    // Fixed-width scalar with memcpy (host order, little-endian only)
    template <typename T>
    void write_scalar(T v) {
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + sizeof(v));
        std::memcpy(buffer.data() + old_size, &v, sizeof(v));
    }

    void write_u32(uint32_t v) {
        write_scalar(v);
    }

    void write_string(const std::string& s) {
        write_u32(static_cast<uint32_t>(s.size()));
        write_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    void write_bytes(const uint8_t* data, std::size_t size) {
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + size);
        if (size != 0) {
            std::memcpy(buffer.data() + old_size, data, size);
        }
    }
};

// Helper: read bytes from buffer
class ByteReader {
public:
    const uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;

    ByteReader(const uint8_t* d, std::size_t s) : data(d), size(s) {}

    bool has_bytes(std::size_t n) const {
        return pos + n <= size;
    }

    bool at_end() const {
        return pos == size;
    }

    uint8_t read_u8() {
        if (!has_bytes(1)) throw std::runtime_error("Unexpected end of buffer");
        return data[pos++];
    }

    template <typename T>
    T read_scalar() {
        if (!has_bytes(sizeof(T))) throw std::runtime_error("Unexpected end of buffer");
        T v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    uint32_t read_u32() {
        return read_scalar<uint32_t>();
    }

    std::string read_string() {
        uint32_t len = read_u32();
        if (!has_bytes(len)) throw std::runtime_error("Unexpected end of buffer");
        std::string s(reinterpret_cast<const char*>(data + pos), len);
        pos += len;
        return s;
    }

    void skip(std::size_t n) {
        if (!has_bytes(n)) throw std::runtime_error("Unexpected end of buffer");
        pos += n;
    }
};

void serialize_value(ByteWriter& w, const Value& val) {
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            w.write_tag(TypeTag::Null);
        } else if constexpr (std::is_same_v<T, int8_t>) {
            w.write_tag(TypeTag::Int8);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, int16_t>) {
            w.write_tag(TypeTag::Int16);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, int32_t>) {
            w.write_tag(TypeTag::Int32);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            w.write_tag(TypeTag::Int64);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            w.write_tag(TypeTag::UInt8);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, uint16_t>) {
            w.write_tag(TypeTag::UInt16);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            w.write_tag(TypeTag::UInt32);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            w.write_tag(TypeTag::UInt64);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, float>) {
            w.write_tag(TypeTag::Float);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_tag(TypeTag::Double);
            w.write_scalar(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            w.write_tag(TypeTag::Bool);
            w.write_u8(arg ? 0x01 : 0x00);
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.write_tag(TypeTag::String);
            w.write_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            w.write_tag(TypeTag::Map);
            w.write_u32(static_cast<uint32_t>(arg.size()));
            for (const auto& [k, v] : arg) {
                w.write_string(k);
                serialize_value(w, *v);
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            w.write_tag(TypeTag::Vector);
            w.write_u32(static_cast<uint32_t>(arg.size()));
            for (const auto& v : arg) {
                serialize_value(w, *v);
            }
        } else if constexpr (std::is_same_v<T, RawValue>) {
            w.write_u8(arg.kind);
            w.write_bytes(arg.data.data(), arg.data.size());
        }
    }, val.data);
}

// Containers nest one level per map or vector header
void enter_container(std::size_t depth) {
    if (depth >= max_nesting_depth) {
        throw std::runtime_error("Nesting too deep");
    }
}

Value deserialize_value(ByteReader& r, std::size_t depth);

Value deserialize_payload(ByteReader& r, TypeTag tag, std::size_t depth = 0) {
    switch (tag) {
        case TypeTag::Null:
            return Value{};

        case TypeTag::Int8:
            return Value{r.read_scalar<int8_t>()};

        case TypeTag::Int16:
            return Value{r.read_scalar<int16_t>()};

        case TypeTag::Int32:
            return Value{r.read_scalar<int32_t>()};

        case TypeTag::Int64:
            return Value{r.read_scalar<int64_t>()};

        case TypeTag::UInt8:
            return Value{r.read_scalar<uint8_t>()};

        case TypeTag::UInt16:
            return Value{r.read_scalar<uint16_t>()};

        case TypeTag::UInt32:
            return Value{r.read_scalar<uint32_t>()};

        case TypeTag::UInt64:
            return Value{r.read_scalar<uint64_t>()};

        case TypeTag::Float:
            return Value{r.read_scalar<float>()};

        case TypeTag::Double:
            return Value{r.read_scalar<double>()};

        case TypeTag::Bool:
            return Value{r.read_u8() != 0};

        case TypeTag::String:
            return Value{r.read_string()};

        case TypeTag::Map: {
            enter_container(depth);
            uint32_t count = r.read_u32();
            MapBuilder builder;
            for (uint32_t i = 0; i < count; ++i) {
                std::string key = r.read_string();
                builder.set(key, deserialize_value(r, depth + 1));
            }
            return builder.finish();
        }

        case TypeTag::Vector: {
            enter_container(depth);
            uint32_t count = r.read_u32();
            VectorBuilder builder;
            for (uint32_t i = 0; i < count; ++i) {
                builder.push_back(deserialize_value(r, depth + 1));
            }
            return builder.finish();
        }

        default:
            throw std::runtime_error("Unknown type tag: " + std::to_string(static_cast<int>(tag)));
    }
}

Value deserialize_value(ByteReader& r, std::size_t depth) {
    return deserialize_payload(r, static_cast<TypeTag>(r.read_u8()), depth);
}

// Advance past one payload without materializing it
void skip_payload(ByteReader& r, TypeTag tag, std::size_t depth) {
    switch (tag) {
        case TypeTag::Null:
            return;
        case TypeTag::Int8:
        case TypeTag::UInt8:
        case TypeTag::Bool:
            r.skip(1);
            return;
        case TypeTag::Int16:
        case TypeTag::UInt16:
            r.skip(2);
            return;
        case TypeTag::Int32:
        case TypeTag::UInt32:
        case TypeTag::Float:
            r.skip(4);
            return;
        case TypeTag::Int64:
        case TypeTag::UInt64:
        case TypeTag::Double:
            r.skip(8);
            return;
        case TypeTag::String:
            r.skip(r.read_u32());
            return;
        case TypeTag::Map: {
            enter_container(depth);
            uint32_t count = r.read_u32();
            for (uint32_t i = 0; i < count; ++i) {
                r.skip(r.read_u32());
                skip_payload(r, static_cast<TypeTag>(r.read_u8()), depth + 1);
            }
            return;
        }
        case TypeTag::Vector: {
            enter_container(depth);
            uint32_t count = r.read_u32();
            for (uint32_t i = 0; i < count; ++i) {
                skip_payload(r, static_cast<TypeTag>(r.read_u8()), depth + 1);
            }
            return;
        }
        default:
            throw std::runtime_error("Unknown type tag: " + std::to_string(static_cast<int>(tag)));
    }
}

std::size_t calc_serialized_size(const Value& val) {
    std::size_t size = 1; // type tag

    std::visit([&size](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // no extra data
        } else if constexpr (std::is_same_v<T, bool>) {
            size += 1;
        } else if constexpr (std::is_arithmetic_v<T>) {
            size += sizeof(T);
        } else if constexpr (std::is_same_v<T, std::string>) {
            size += 4 + arg.size();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            size += 4; // count
            for (const auto& [k, v] : arg) {
                size += 4 + k.size(); // key string
                size += calc_serialized_size(*v);
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            size += 4; // count
            for (const auto& v : arg) {
                size += calc_serialized_size(*v);
            }
        } else if constexpr (std::is_same_v<T, RawValue>) {
            size += arg.data.size();
        }
    }, val.data);

    return size;
}

} // anonymous namespace

ByteBuffer serialize(const Value& val) {
    ByteWriter w;
    w.buffer.reserve(calc_serialized_size(val));
    serialize_value(w, val);
    return std::move(w.buffer);
}

Value deserialize(const ByteBuffer& buffer) {
    return deserialize(buffer.data(), buffer.size());
}

Value deserialize(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        return Value{};
    }
    ByteReader r(data, size);
    return deserialize_value(r, 0);
}

std::size_t serialized_size(const Value& val) {
    return calc_serialized_size(val);
}

Value RawValue::unmarshal() const {
    ByteReader r(data.data(), data.size());
    try {
        Value result = deserialize_payload(r, static_cast<TypeTag>(kind));
        if (!r.at_end()) {
            throw std::runtime_error("Trailing bytes after value");
        }
        return result;
    } catch (const std::runtime_error& e) {
        throw DecodeError(e.what());
    }
}

ByteBuffer marshal_document(const Value& val) {
    if (auto* raw = val.get_if<RawValue>()) {
        if (!raw->is_document()) {
            throw MarshalError("attempted to marshal raw kind " +
                               std::to_string(static_cast<int>(raw->kind)) + " as a document");
        }
    } else if (!val.is_map()) {
        throw MarshalError("can't marshal " + std::string(kind_name(val)) + " as a document");
    }
    return serialize(val);
}

ValueMap unmarshal_fields(const ByteBuffer& buffer) {
    ByteReader r(buffer.data(), buffer.size());
    try {
        auto tag = static_cast<TypeTag>(r.read_u8());
        if (tag != TypeTag::Map) {
            throw std::runtime_error("Document root has type tag " +
                                     std::to_string(static_cast<int>(tag)));
        }
        uint32_t count = r.read_u32();
        MapBuilder fields;
        for (uint32_t i = 0; i < count; ++i) {
            std::string key = r.read_string();
            uint8_t kind = r.read_u8();
            std::size_t start = r.pos;
            skip_payload(r, static_cast<TypeTag>(kind), 1);
            fields.set(key, RawValue{kind, ByteBuffer(r.data + start, r.data + r.pos)});
        }
        if (!r.at_end()) {
            throw std::runtime_error("Trailing bytes after document");
        }
        return fields.finish_map();
    } catch (const std::runtime_error& e) {
        throw DecodeError(e.what());
    }
}

} // namespace docupdate
