//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_TREE_HPP_INCLUDED
#define TREECONV_TREE_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace treeconv
{

/// The generic (loosely typed) data tree: null, scalar, sequence or map.
///
/// Trees are whatever a document parser (yaml-cpp here) materialized;
/// the engine never parses or emits text itself.
///
using Tree = YAML::Node;

namespace tree
{

/// Kind of a tree node, with scalars resolved to their data kind.
///
enum class NodeKind : std::uint8_t
{
    Null,
    Bool,
    Integer,
    Float,
    String,
    Sequence,
    Map,
};

/// Classifies a node.
///
/// yaml-cpp keeps scalars as text, so a scalar kind is decided by its tag first
/// (`!` for quoted scalars, explicit `!!str`, `!!int` and so on), and then by the YAML 1.2 core schema
/// resolution of plain scalars. An undefined node is classified as `Null`.
///
CETL_NODISCARD NodeKind kindOf(const Tree& node);

CETL_NODISCARD const char* kindName(const NodeKind kind) noexcept;

CETL_NODISCARD inline const char* kindName(const Tree& node)
{
    return kindName(kindOf(node));
}

CETL_NODISCARD Tree makeNull();
CETL_NODISCARD Tree makeBool(const bool value);
CETL_NODISCARD Tree makeInteger(const std::int64_t value);
CETL_NODISCARD Tree makeFloat(const double value);

/// Makes a string scalar.
///
/// Text that would resolve to another kind as a plain scalar (like "42" or "true") is tagged `!!str`.
///
CETL_NODISCARD Tree makeString(const std::string& value);

CETL_NODISCARD Tree makeSequence();
CETL_NODISCARD Tree makeMap();

CETL_NODISCARD cetl::optional<bool>         asBool(const Tree& node);
CETL_NODISCARD cetl::optional<std::int64_t> asInteger(const Tree& node);
CETL_NODISCARD cetl::optional<double>       asFloat(const Tree& node);
CETL_NODISCARD cetl::optional<std::string>  asString(const Tree& node);

/// Deep structural equality.
///
/// Map key order is not significant. Integer and float scalars compare numerically.
///
CETL_NODISCARD bool equal(const Tree& lhs, const Tree& rhs);

}  // namespace tree
}  // namespace treeconv

#endif  // TREECONV_TREE_HPP_INCLUDED
