//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_OBJECT_CONVERTER_HPP_INCLUDED
#define TREECONV_OBJECT_CONVERTER_HPP_INCLUDED

#include "context.hpp"
#include "converter.hpp"
#include "type_descriptor.hpp"

#include <cetl/cetl.hpp>

#include <string>
#include <vector>

namespace treeconv
{

/// Per attribute plan of an object converter, built once per object type.
///
struct AttributeDefinition final
{
    std::string              name;
    std::string              data_key;
    std::vector<std::string> aliases;
    bool                     inject_key{false};
    bool                     inject_leftovers{false};

    /// Supplies the value independently of the data; takes precedence over the converter.
    Provider::Ptr provider;

    Converter::Ptr converter;
    Getter         getter;

};  // AttributeDefinition

/// Derives the definition of an object parameter: a provider if the context has one
/// for the parameter type, otherwise a converter for it.
///
/// @param type The already resolved parameter type (see `MissingTypePolicy`).
/// @throws ResolutionError if there is no converter for the type.
///
CETL_NODISCARD AttributeDefinition makeAttributeDefinition(const Parameter&      parameter,
                                                           const TypeDescriptor& type,
                                                           Context&              context);

/// Maps the named attributes of an object type to the keys of a data tree map.
///
/// @param type Object type (of `TypeKind::Object`) to construct on load.
/// @param dump_null_values Whether attributes dumped as null are kept in the output.
///
CETL_NODISCARD Converter::Ptr makeObjectConverter(const TypeDescriptor&            type,
                                                  std::vector<AttributeDefinition> attributes,
                                                  const bool                       dump_null_values);

}  // namespace treeconv

#endif  // TREECONV_OBJECT_CONVERTER_HPP_INCLUDED
