//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_FACTORIES_HPP_INCLUDED
#define TREECONV_FACTORIES_HPP_INCLUDED

#include "context.hpp"
#include "converter.hpp"
#include "type_descriptor.hpp"

#include <cetl/cetl.hpp>

#include <string>
#include <utility>
#include <vector>

namespace treeconv
{

// Each factory declines (returns `nullptr`) types of another shape.

CETL_NODISCARD ConverterFactory::Ptr makeTupleConverterFactory();
CETL_NODISCARD ConverterFactory::Ptr makeSequenceConverterFactory();
CETL_NODISCARD ConverterFactory::Ptr makeMappingConverterFactory();
CETL_NODISCARD ConverterFactory::Ptr makeSetConverterFactory();
CETL_NODISCARD ConverterFactory::Ptr makeEnumConverterFactory();

/// Builds object converters from the parameter lists of object types.
///
/// Fails hard (`ResolutionError`) on a parameter without type information
/// unless the missing type policy says otherwise.
///
CETL_NODISCARD ConverterFactory::Ptr makeObjectConverterFactory(const MissingTypePolicy missing_type_policy,
                                                                const bool              dump_null_values);

/// Builds untagged union converters; every member type must be resolvable.
///
CETL_NODISCARD ConverterFactory::Ptr makeUnionConverterFactory();

CETL_NODISCARD ConverterFactory::Ptr makeLiteralConverterFactory();

/// Claims every type of the tag map, and builds a discriminated union converter over all of them;
/// the member converters are built by the given member factory.
///
/// Insert it in front of the chain (`Context::insertFactory(0, ...)`) to override the object factory.
/// Fails hard (`ResolutionError`) if the member factory declines a mapped type.
///
CETL_NODISCARD ConverterFactory::Ptr makeDiscriminatedConverterFactory(
    std::vector<std::pair<std::string, TypeDescriptor>> tag_types,
    ConverterFactory::Ptr                               member_factory,
    std::string                                         tag_key = "type");

/// The default chain: Tuple, Sequence, Mapping, Set, Enum, Object, Union, Literal.
///
CETL_NODISCARD std::vector<ConverterFactory::Ptr> makeDefaultFactories(const Context::Options& options);

}  // namespace treeconv

#endif  // TREECONV_FACTORIES_HPP_INCLUDED
