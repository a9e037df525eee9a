//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_TREECONV_HPP_INCLUDED
#define TREECONV_TREECONV_HPP_INCLUDED

#include "config.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "object.hpp"
#include "tree.hpp"
#include "type_descriptor.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>

#include <utility>

namespace treeconv
{

/// Loads a value of the described type from the data tree.
///
/// @throws LoadError if the data doesn't fit the type.
/// @throws ResolutionError if there is no converter for the type (or one of its parts).
///
CETL_NODISCARD Object load(Context& context, const TypeDescriptor& type, const Tree& data, const Key& key = {});

/// Dumps a value of the described type to a data tree.
///
/// @throws DumpError if the value doesn't fit the type.
/// @throws ResolutionError if there is no converter for the type (or one of its parts).
///
CETL_NODISCARD Tree dump(Context& context, const TypeDescriptor& type, const Object& value);

/// Makes a context with the conversion options of the configuration,
/// and applies its logging levels.
///
CETL_NODISCARD Context::Ptr makeContext(const Config& config);

/// The process wide context with default options.
///
/// For the application boundary only: libraries should take a context from their caller.
///
Context& defaultContext();

namespace detail
{

[[noreturn]] void throwLoadedTypeMismatch(const TypeDescriptor& type, const Object& value, const Key& key);

}  // namespace detail

template <typename T>
T load(Context& context, const Tree& data, const Key& key = {})
{
    const auto type  = typeOf<T>();
    auto       value = load(context, type, data, key);
    if (!detail::holds<T>(value))
    {
        detail::throwLoadedTypeMismatch(type, value, key);
    }
    return detail::objectCast<T>(std::move(value));
}

template <typename T>
T load(const Tree& data, const Key& key = {})
{
    return load<T>(defaultContext(), data, key);
}

template <typename T>
Tree dump(Context& context, const T& value)
{
    return dump(context, typeOf<T>(), detail::toObject<T>(value));
}

template <typename T>
Tree dump(const T& value)
{
    return dump<T>(defaultContext(), value);
}

}  // namespace treeconv

#endif  // TREECONV_TREECONV_HPP_INCLUDED
