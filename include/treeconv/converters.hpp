//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_CONVERTERS_HPP_INCLUDED
#define TREECONV_CONVERTERS_HPP_INCLUDED

#include "context.hpp"
#include "converter.hpp"
#include "object.hpp"
#include "tree.hpp"
#include "type_descriptor.hpp"

#include <cetl/cetl.hpp>

#include <string>
#include <vector>

namespace treeconv
{

// MARK: - Leaf converters

/// Passes trees through unchanged in both directions.
///
CETL_NODISCARD Converter::Ptr makeExactConverter();

/// Scalar of the given kind, also accepting scalars of the fallback kinds on load
/// (a float loaded as an integer is truncated).
///
CETL_NODISCARD Converter::Ptr makePrimitiveConverter(const PrimitiveKind kind, std::vector<PrimitiveKind> fallbacks = {});

/// Accepts only null.
///
CETL_NODISCARD Converter::Ptr makeNoneConverter();

/// `Bytes` as UTF-8 text (strict: dumping invalid UTF-8 fails).
///
CETL_NODISCARD Converter::Ptr makeBytesConverter();

/// `Timestamp` as a (float) number of seconds since the epoch.
///
CETL_NODISCARD Converter::Ptr makeTimestampConverter();

CETL_NODISCARD Converter::Ptr makeAnyConverter(const AnyLoadPolicy load_policy, const AnyDumpPolicy dump_policy);

/// Accepts only a tree equal to the constant; dumps the constant.
///
CETL_NODISCARD Converter::Ptr makeLiteralConverter(Tree value, Object object);

// MARK: - Composite converters

CETL_NODISCARD Converter::Ptr makeSequenceConverter(const TypeDescriptor& type, Converter::Ptr item_converter);
CETL_NODISCARD Converter::Ptr makeSetConverter(const TypeDescriptor& type, Converter::Ptr item_converter);
CETL_NODISCARD Converter::Ptr makeMappingConverter(const TypeDescriptor& type, Converter::Ptr value_converter);
CETL_NODISCARD Converter::Ptr makeTupleConverter(const TypeDescriptor& type, std::vector<Converter::Ptr> converters);

/// Untagged union: members are tried in order, the first success wins.
///
CETL_NODISCARD Converter::Ptr makeUnionConverter(const TypeDescriptor& type, std::vector<Converter::Ptr> converters);

/// Enumeration by (integer) value.
///
CETL_NODISCARD Converter::Ptr makeEnumConverter(const TypeDescriptor& type);

/// Member of a discriminated union.
///
struct DiscriminatedMember final
{
    std::string    tag;
    TypeDescriptor type;
    Converter::Ptr converter;

};  // DiscriminatedMember

/// Discriminated ("tagged") union: the member is selected by the value of the tag key.
///
/// Members must load from (and dump to) maps; the tag is merged into the dumped map.
///
CETL_NODISCARD Converter::Ptr makeDiscriminatedConverter(std::vector<DiscriminatedMember> members,
                                                         std::string                      tag_key = "type");

}  // namespace treeconv

#endif  // TREECONV_CONVERTERS_HPP_INCLUDED
