// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document.h
/// @brief Conversion of typed values into the dynamic document model.
///
/// to_value() encodes any described type as a Value, the way it would be
/// stored:
/// - scalars keep their width; time points become int64 milliseconds
/// - absent pointers become null
/// - sequences become vectors, string-keyed maps become maps
/// - records become maps keyed by their descriptor, with zero omitempty
///   fields dropped and inline map entries merged in
/// - types with a get_document() hook are replaced by the hook's result

#pragma once

#include "api.h"
#include "type_info.h"
#include "value.h"

namespace docupdate {

/// Call the get_document() hook of value's type
/// @throws RepresentationError if the hook throws
[[nodiscard]] DOCUPDATE_API Boxed represent(ValueRef value);

/// @throws ShapeError for a map with non-text keys
/// @throws ConflictError for an inline map key that is also a field key
/// @throws MarshalError for values with no document form (functions)
/// @throws DescriptorError for malformed record types
[[nodiscard]] DOCUPDATE_API Value to_value(ValueRef value);

template <typename T>
[[nodiscard]] Value to_value(const T& value) {
    return to_value(ref_of(value));
}

} // namespace docupdate
