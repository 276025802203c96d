// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file zero.h
/// @brief Zero-value test used for omitempty fields.
///
/// | Kind                 | Zero when                                        |
/// |----------------------|--------------------------------------------------|
/// | String               | empty                                            |
/// | Pointer              | absent                                           |
/// | Sequence, Map        | size() == 0                                      |
/// | Int, Uint, Float     | equal to 0                                       |
/// | Bool                 | false                                            |
/// | Time                 | equal to time_point{}                            |
/// | Record               | every visible or embedded field is zero          |
/// | Dynamic (Value)      | null                                             |
/// | Raw, Func, Opaque    | never                                            |

#pragma once

#include "api.h"
#include "type_info.h"

namespace docupdate {

[[nodiscard]] DOCUPDATE_API bool is_zero(ValueRef value);

template <typename T>
[[nodiscard]] bool is_zero(const T& value) {
    return is_zero(ref_of(value));
}

} // namespace docupdate
