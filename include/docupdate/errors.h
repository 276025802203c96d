// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception hierarchy thrown by docupdate.
///
/// Every failure surfaces as an UpdateError subclass so callers can catch
/// the whole family at once or pick out one phase:
///
/// | Type                | Raised when                                          |
/// |---------------------|------------------------------------------------------|
/// | DescriptorError     | a record type is malformed (bad tag, duplicate key)  |
/// | ConflictError       | an inline map key collides with a declared field     |
/// | ShapeError          | a mapping is not keyed by text                       |
/// | MarshalError        | a value cannot be encoded as a document root         |
/// | DecodeError         | encoded bytes cannot be decoded                      |
/// | RepresentationError | a get_document() hook threw                          |

#pragma once

#include <stdexcept>
#include <string>

namespace docupdate {

class UpdateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed record type. Raised at first use of the type and never cached.
class DescriptorError : public UpdateError {
public:
    using UpdateError::UpdateError;
};

class ConflictError : public UpdateError {
public:
    using UpdateError::UpdateError;
};

class ShapeError : public UpdateError {
public:
    using UpdateError::UpdateError;
};

class MarshalError : public UpdateError {
public:
    explicit MarshalError(const std::string& what)
        : UpdateError("cannot marshal: " + what) {}
};

class DecodeError : public UpdateError {
public:
    explicit DecodeError(const std::string& what)
        : UpdateError("cannot unmarshal: " + what) {}
};

class RepresentationError : public UpdateError {
public:
    explicit RepresentationError(const std::string& what)
        : UpdateError("custom representation failed: " + what) {}
};

} // namespace docupdate
