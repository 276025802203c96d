// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file struct_info.h
/// @brief Document layout of record types.
///
/// describe() maps the registered fields of a record to document keys,
/// applying the field tags:
///
/// | Tag               | Effect                                                 |
/// |-------------------|--------------------------------------------------------|
/// | ""                | key is the field name in lower case                    |
/// | "key"             | key is "key"                                           |
/// | "-"               | field is left out                                      |
/// | ",omitempty"      | a zero value is scheduled for removal                  |
/// | ",minsize"        | carried through, not interpreted                       |
/// | ",inline"         | record fields / map entries merge into the parent      |
///
/// Descriptors are built once per type and cached for the life of the
/// process. The cache may be read and filled from any number of threads.

#pragma once

#include "api.h"
#include "type_info.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docupdate {

struct FieldDescriptor {
    std::string key;
    std::size_t num = 0;       ///< ordinal within the declaring record
    bool omit_empty = false;
    bool min_size = false;
    /// Ordinals from the described record down to the field when it was
    /// spliced in from an inline record; empty for a direct field.
    std::vector<std::size_t> inline_path;
};

struct StructInfo {
    const TypeInfo* type = nullptr;
    std::unordered_map<std::string, FieldDescriptor> fields_map;
    std::vector<FieldDescriptor> fields_list;  ///< declaration order
    /// Ordinal path to the inline string-keyed map field, empty if none
    std::vector<std::size_t> inline_map;

    [[nodiscard]] bool has_inline_map() const noexcept { return !inline_map.empty(); }

    [[nodiscard]] const FieldDescriptor* find(const std::string& key) const {
        auto it = fields_map.find(key);
        return it == fields_map.end() ? nullptr : &it->second;
    }
};

/// Descriptor of a record type
/// @throws DescriptorError if the type is malformed; nothing is cached then
[[nodiscard]] DOCUPDATE_API std::shared_ptr<const StructInfo> describe(const TypeInfo& type);

template <Record T>
[[nodiscard]] std::shared_ptr<const StructInfo> describe() {
    return describe(type_of<T>());
}

/// Locate a described field inside an instance of the record
[[nodiscard]] DOCUPDATE_API ValueRef field_ref(const StructInfo& info,
                                               const FieldDescriptor& field,
                                               const void* owner);

/// Locate the inline map of an instance; {} when the record has none
[[nodiscard]] DOCUPDATE_API ValueRef inline_map_ref(const StructInfo& info, const void* owner);

/// Number of record types described so far
[[nodiscard]] DOCUPDATE_API std::size_t descriptor_cache_size();

} // namespace docupdate
