// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file update.h
/// @brief Build an update document from a record, a mapping or a raw document.
///
/// as_update() lists every field of its argument so that applying the
/// result touches exactly the fields the argument knows about:
/// - omitempty fields holding a zero value go to Update::unset
/// - all other fields go to Update::set
/// - the identity key "_id" is never part of either half
///
/// Usage:
/// @code
///   Account acct{.id = "a1", .owner = "ann", .balance = 0};
///   auto u = docupdate::as_update(acct);
///   // u.set   == {"owner": "ann"}
///   // u.unset == {"balance": null}
///   collection.update_one(filter_by_id(acct.id), u.to_value());
/// @endcode
///
/// The argument is first resolved: get_document() hooks are applied and
/// pointer-like values dereferenced until neither applies. Records use their
/// descriptor; mappings are copied entry by entry; anything else is encoded
/// as a document and split into its top-level fields.

#pragma once

#include "api.h"
#include "type_info.h"
#include "value.h"

namespace docupdate {

struct DOCUPDATE_API Update {
    /// Fields to assign, keyed by document key
    ValueMap set;
    /// Fields to remove; the values are null placeholders
    ValueMap unset;

    /// The update operator document {"$set": {...}, "$unset": {...}}.
    /// An empty half is left out.
    [[nodiscard]] Value to_value() const;

    [[nodiscard]] bool empty() const noexcept { return set.empty() && unset.empty(); }
};

/// @throws DescriptorError   malformed record type
/// @throws ConflictError     inline map key equal to a field key
/// @throws ShapeError        mapping not keyed by text
/// @throws MarshalError      value with no document form, or an absent pointer
/// @throws DecodeError       raw document that cannot be split into fields
/// @throws RepresentationError  a get_document() hook threw
[[nodiscard]] DOCUPDATE_API Update as_update(ValueRef value);

[[nodiscard]] DOCUPDATE_API Update as_update(const Boxed& value);

template <typename T>
[[nodiscard]] Update as_update(const T& value) {
    return as_update(ref_of(value));
}

} // namespace docupdate
