//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_ERRORS_HPP_INCLUDED
#define TREECONV_ERRORS_HPP_INCLUDED

#include "tree.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace treeconv
{

/// A node of the diagnostic tree.
///
/// Every layer which adds context (attribute, index, map key, union member) wraps the failure
/// of the layer below as a child node, so the full path from the root object down to the failing
/// leaf stays reconstructible.
///
struct ErrorInfo final
{
    std::string                 message;
    std::string                 code;
    cetl::optional<std::string> target;
    std::vector<ErrorInfo>      details;

    /// Renders the error as a machine-readable tree:
    /// a map with `code`, `message`, `target` (null if absent) and `details` (sequence of the same).
    ///
    CETL_NODISCARD Tree toTree() const;

    /// Renders the error as an indented (by tabs) human-readable multi-line trace.
    ///
    CETL_NODISCARD std::string toReadableFormat(const std::size_t indent = 0) const;

    /// Makes a leaf from an arbitrary exception; the code is the exception's type name.
    ///
    CETL_NODISCARD static ErrorInfo fromException(const std::exception& ex);

    CETL_NODISCARD static ErrorInfo invalidType(const std::string&          expected,
                                                const std::string&          actual,
                                                cetl::optional<std::string> target);

    /// Makes a new parent node with the given cause as its only child.
    ///
    CETL_NODISCARD static ErrorInfo wrap(std::string                 message,
                                         std::string                 code,
                                         cetl::optional<std::string> target,
                                         ErrorInfo                   cause);

};  // ErrorInfo

/// Base of the data conversion errors.
///
class Error : public std::runtime_error
{
public:
    explicit Error(ErrorInfo info);

    CETL_NODISCARD const ErrorInfo& info() const noexcept
    {
        return info_;
    }

    CETL_NODISCARD const std::string& code() const noexcept
    {
        return info_.code;
    }

private:
    ErrorInfo info_;

};  // Error

/// Failure to convert a tree into an object.
///
class LoadError final : public Error
{
public:
    using Error::Error;
};

/// Failure to convert an object into a tree.
///
class DumpError final : public Error
{
public:
    using Error::Error;
};

/// No converter could be resolved for a type descriptor.
///
/// Raised eagerly by the context (or by a factory which matched the type but can't proceed),
/// never deferred to the load/dump time.
///
class ResolutionError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// A required argument of an object construct callable was not supplied.
///
class MissingArgumentError final : public std::runtime_error
{
public:
    explicit MissingArgumentError(const std::string& argument_name)
        : std::runtime_error{"Missing required argument '" + argument_name + "'"}
    {
    }
};

}  // namespace treeconv

#endif  // TREECONV_ERRORS_HPP_INCLUDED
