// struct_info.cpp - Record descriptors and the process-wide descriptor cache

#include <docupdate/struct_info.h>
#include <docupdate/errors.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <shared_mutex>

namespace docupdate {

namespace {

// ============================================================
// Descriptor cache
//
// Readers take a shared lock. A descriptor is built with no lock held and
// published under an exclusive lock, so a reader sees either nothing or a
// complete descriptor. When two threads build the same type concurrently
// the first one to publish wins.
// ============================================================
class DescriptorCache {
public:
    using SharedLock = std::shared_lock<std::shared_mutex>;
    using UniqueLock = std::unique_lock<std::shared_mutex>;
    using Ptr = std::shared_ptr<const StructInfo>;

    Ptr find(std::type_index id) const {
        SharedLock read_lock(rw_mutex_);
        auto it = entries_.find(id);
        return it == entries_.end() ? nullptr : it->second;
    }

    Ptr publish(std::type_index id, Ptr info) {
        UniqueLock write_lock(rw_mutex_);
        return entries_.try_emplace(id, std::move(info)).first->second;
    }

    std::size_t size() const {
        SharedLock read_lock(rw_mutex_);
        return entries_.size();
    }

private:
    mutable std::shared_mutex rw_mutex_;
    std::unordered_map<std::type_index, Ptr> entries_;
};

DescriptorCache& cache() {
    static DescriptorCache instance;
    return instance;
}

[[noreturn]] void fail(std::string_view type_name, const std::string& message) {
    detail::log_config_error(type_name, message);
    throw DescriptorError(message);
}

std::string lowercase(std::string_view name) {
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

struct ParsedTag {
    std::string key;
    bool omit_empty = false;
    bool min_size = false;
    bool inline_ = false;
};

ParsedTag parse_tag(std::string_view tag, const TypeInfo& owner) {
    ParsedTag parsed;
    auto comma = tag.find(',');
    parsed.key = std::string(tag.substr(0, comma));
    while (comma != std::string_view::npos) {
        auto start = comma + 1;
        comma = tag.find(',', start);
        auto flag = tag.substr(start, comma == std::string_view::npos ? comma : comma - start);
        if (flag == "omitempty") {
            parsed.omit_empty = true;
        } else if (flag == "minsize") {
            parsed.min_size = true;
        } else if (flag == "inline") {
            parsed.inline_ = true;
        } else {
            fail(owner.name, "Unsupported flag \"" + std::string(flag) + "\" in tag \"" +
                                 std::string(tag) + "\" of type " + std::string(owner.name));
        }
    }
    return parsed;
}

// Removes the type from the visiting set on every exit path
class VisitGuard {
public:
    VisitGuard(std::vector<std::type_index>& visiting, const TypeInfo& type)
        : visiting_(visiting) {
        if (std::find(visiting_.begin(), visiting_.end(), type.id) != visiting_.end()) {
            fail(type.name, "Recursive ,inline of struct " + std::string(type.name));
        }
        visiting_.push_back(type.id);
    }
    ~VisitGuard() { visiting_.pop_back(); }

    VisitGuard(const VisitGuard&) = delete;
    VisitGuard& operator=(const VisitGuard&) = delete;

private:
    std::vector<std::type_index>& visiting_;
};

std::shared_ptr<const StructInfo> describe_impl(const TypeInfo& type,
                                                std::vector<std::type_index>& visiting);

void add_field(StructInfo& info, FieldDescriptor field) {
    if (info.fields_map.count(field.key)) {
        fail(info.type->name,
             "Duplicated key '" + field.key + "' in struct " + std::string(info.type->name));
    }
    info.fields_map.emplace(field.key, field);
    info.fields_list.push_back(std::move(field));
}

void splice_inline_record(StructInfo& info, std::size_t num, const StructInfo& sub) {
    for (auto field : sub.fields_list) {
        if (field.inline_path.empty()) {
            field.inline_path = {num, field.num};
        } else {
            field.inline_path.insert(field.inline_path.begin(), num);
        }
        add_field(info, std::move(field));
    }
    if (sub.has_inline_map()) {
        if (info.has_inline_map()) {
            fail(info.type->name,
                 "Multiple ,inline maps in struct " + std::string(info.type->name));
        }
        info.inline_map = sub.inline_map;
        info.inline_map.insert(info.inline_map.begin(), num);
    }
}

std::shared_ptr<StructInfo> build(const TypeInfo& type, std::vector<std::type_index>& visiting) {
    VisitGuard guard(visiting, type);

    auto info = std::make_shared<StructInfo>();
    info->type = &type;

    const auto& fields = type.fields();
    info->fields_list.reserve(fields.size());

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const FieldInfo& field = fields[i];
        if (!field.exported && !field.anonymous) {
            continue;
        }
        if (field.tag == "-") {
            continue;
        }

        ParsedTag tag = parse_tag(field.tag, type);

        if (tag.inline_) {
            const TypeInfo& field_type = field.type();
            switch (field_type.kind) {
                case Kind::Map:
                    if (info->has_inline_map()) {
                        fail(type.name, "Multiple ,inline maps in struct " + std::string(type.name));
                    }
                    if (field_type.key().kind != Kind::String) {
                        fail(type.name, "Option ,inline needs a map with string keys in struct " +
                                            std::string(type.name));
                    }
                    info->inline_map = {i};
                    break;
                case Kind::Record:
                    splice_inline_record(*info, i, *describe_impl(field_type, visiting));
                    break;
                default:
                    fail(type.name, "Option ,inline needs a struct value or map field in struct " +
                                        std::string(type.name));
            }
            continue;
        }

        FieldDescriptor descriptor;
        descriptor.key = tag.key.empty() ? lowercase(field.name) : tag.key;
        descriptor.num = i;
        descriptor.omit_empty = tag.omit_empty;
        descriptor.min_size = tag.min_size;
        add_field(*info, std::move(descriptor));
    }
    return info;
}

std::shared_ptr<const StructInfo> describe_impl(const TypeInfo& type,
                                                std::vector<std::type_index>& visiting) {
    if (auto found = cache().find(type.id)) {
        return found;
    }
    if (!type.is_record()) {
        fail(type.name, "Cannot describe " + std::string(type.name) + " as a struct");
    }
    return cache().publish(type.id, build(type, visiting));
}

ValueRef follow(const TypeInfo& type, const void* owner, const std::vector<std::size_t>& path) {
    ValueRef current{&type, owner};
    for (std::size_t num : path) {
        current = current.type->fields()[num].ref(current.ptr);
    }
    return current;
}

} // anonymous namespace

std::shared_ptr<const StructInfo> describe(const TypeInfo& type) {
    std::vector<std::type_index> visiting;
    return describe_impl(type, visiting);
}

ValueRef field_ref(const StructInfo& info, const FieldDescriptor& field, const void* owner) {
    if (field.inline_path.empty()) {
        return info.type->fields()[field.num].ref(owner);
    }
    return follow(*info.type, owner, field.inline_path);
}

ValueRef inline_map_ref(const StructInfo& info, const void* owner) {
    if (!info.has_inline_map()) {
        return {};
    }
    return follow(*info.type, owner, info.inline_map);
}

std::size_t descriptor_cache_size() {
    return cache().size();
}

} // namespace docupdate
