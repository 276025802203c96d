// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Binary encoding of Value and of document roots.
///
/// Binary Format (1-byte type tag, then payload, little-endian; scalars are
/// copied in host byte order, so only little-endian hosts are supported):
///   0x00 = null (no payload)
///   0x01 = int32 (4 bytes)        0x0A = int64 (8 bytes)
///   0x0B = int8 (1 byte)          0x0C = int16 (2 bytes)
///   0x0D = uint8 (1 byte)         0x0E = uint16 (2 bytes)
///   0x0F = uint32 (4 bytes)       0x16 = uint64 (8 bytes)
///   0x02 = float (4 bytes)        0x03 = double (8 bytes)
///   0x04 = bool (1 byte: 0x00=false, 0x01=true)
///   0x05 = string (4-byte length + UTF-8 data)
///   0x06 = map (4-byte count + entries of string key + tagged value)
///   0x07 = vector (4-byte count + tagged values)
///
/// A RawValue is written as its kind byte followed by its data verbatim, so
/// an encoded fragment can be embedded without decoding it first.
///
/// Decoding rejects containers nested deeper than max_nesting_depth.
///
/// A *document* is an encoded map. marshal_document() and unmarshal_fields()
/// deal with documents only and are the pair the update builder uses to
/// normalize pre-encoded and otherwise unrecognized inputs.

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <string>
#include <vector>

namespace docupdate {

// ============================================================
// Value Serialization
// ============================================================

/// Serialize Value to binary buffer
DOCUPDATE_API ByteBuffer serialize(const Value& val);

/// Deserialize Value from binary buffer
/// @return Reconstructed Value, or null Value for an empty buffer
/// @throws std::runtime_error on invalid data format
DOCUPDATE_API Value deserialize(const ByteBuffer& buffer);

/// Deserialize from raw pointer and size
DOCUPDATE_API Value deserialize(const uint8_t* data, std::size_t size);

/// Get serialized size without actually serializing
DOCUPDATE_API std::size_t serialized_size(const Value& val);

// ============================================================
// Document Encoding
// ============================================================

/// Encode val as a document root
/// @throws MarshalError unless val is a map or a RawValue of kind Map
DOCUPDATE_API ByteBuffer marshal_document(const Value& val);

/// Decode a document root into its top-level fields, leaving every field
/// value encoded as a RawValue
/// @throws DecodeError if buffer does not hold exactly one document
DOCUPDATE_API ValueMap unmarshal_fields(const ByteBuffer& buffer);

} // namespace docupdate
