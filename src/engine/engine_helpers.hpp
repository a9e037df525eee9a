//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_ENGINE_HELPERS_HPP_INCLUDED
#define TREECONV_ENGINE_HELPERS_HPP_INCLUDED

#include "treeconv/errors.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>

namespace treeconv
{
namespace engine
{

CETL_NODISCARD std::string demangle(const char* const mangled_name);

/// Human readable name of the runtime type of an object ("None" for an empty one).
///
CETL_NODISCARD std::string typeNameOf(const Object& value);

/// Renders a tree as one line of flow style YAML (for error messages).
///
CETL_NODISCARD std::string describe(const Tree& data);

/// Converts a scalar object (`bool`, integers, `double`, `std::string`, None) or a tree held by an object.
///
CETL_NODISCARD cetl::optional<Tree> treeOfScalar(const Object& value);

/// The shape of a type; throws `ResolutionError` when the type is of another shape.
///
template <typename ShapeT>
CETL_NODISCARD const ShapeT& shapeOf(const TypeDescriptor& type)
{
    const auto* const shape = cetl::get_if<ShapeT>(&type.shape());
    if (shape == nullptr)
    {
        throw ResolutionError{"Type '" + type.name() + "' has unexpected shape."};
    }
    return *shape;
}

CETL_NODISCARD inline ErrorInfo invalidObjectType(const std::string&          expected,
                                                  const Object&               actual,
                                                  cetl::optional<std::string> target = cetl::nullopt)
{
    return ErrorInfo::invalidType(expected, typeNameOf(actual), std::move(target));
}

}  // namespace engine
}  // namespace treeconv

#endif  // TREECONV_ENGINE_HELPERS_HPP_INCLUDED
