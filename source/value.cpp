// value.cpp - Value type utilities

#include <docupdate/value.h>

#include <iomanip>    // for std::setprecision
#include <sstream>    // for std::ostringstream

namespace docupdate {

namespace {

std::string format_raw(const RawValue& raw) {
    std::ostringstream oss;
    oss << "raw(0x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<unsigned>(raw.kind) << std::dec << ", "
        << raw.data.size() << " bytes)";
    return oss.str();
}

} // anonymous namespace

std::string_view kind_name(const Value& val) noexcept
{
    return std::visit([](const auto& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int8_t>) return "int8";
        else if constexpr (std::is_same_v<T, int16_t>) return "int16";
        else if constexpr (std::is_same_v<T, int32_t>) return "int32";
        else if constexpr (std::is_same_v<T, int64_t>) return "int64";
        else if constexpr (std::is_same_v<T, uint8_t>) return "uint8";
        else if constexpr (std::is_same_v<T, uint16_t>) return "uint16";
        else if constexpr (std::is_same_v<T, uint32_t>) return "uint32";
        else if constexpr (std::is_same_v<T, uint64_t>) return "uint64";
        else if constexpr (std::is_same_v<T, float>) return "float";
        else if constexpr (std::is_same_v<T, double>) return "double";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, ValueMap>) return "map";
        else if constexpr (std::is_same_v<T, ValueVector>) return "vector";
        else if constexpr (std::is_same_v<T, RawValue>) return "raw";
        else return "null";
    }, val.data);
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int8_t>) {
            return std::to_string(static_cast<int>(arg)) + "i8";
        } else if constexpr (std::is_same_v<T, int16_t>) {
            return std::to_string(arg) + "i16";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            return std::to_string(static_cast<unsigned>(arg)) + "u8";
        } else if constexpr (std::is_same_v<T, uint16_t>) {
            return std::to_string(arg) + "u16";
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            return std::to_string(arg) + "u";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return std::to_string(arg) + "uL";
        } else if constexpr (std::is_same_v<T, float>) {
            return std::to_string(arg) + "f";
        } else if constexpr (std::is_same_v<T, double>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, RawValue>) {
            return format_raw(arg);
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& [k, v] : arg) {
                    std::cout << indent << prefix << k << ":\n";
                    print_value(*v, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << indent << prefix << "[" << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

} // namespace docupdate
