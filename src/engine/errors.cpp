//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/errors.hpp"

#include "engine_helpers.hpp"
#include "treeconv/tree.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <exception>
#include <string>
#include <typeinfo>
#include <utility>

namespace treeconv
{

Tree ErrorInfo::toTree() const
{
    auto node       = tree::makeMap();
    node["code"]    = tree::makeString(code);
    node["message"] = tree::makeString(message);
    node["target"]  = target ? tree::makeString(*target) : tree::makeNull();

    auto details_node = tree::makeSequence();
    for (const auto& detail : details)
    {
        details_node.push_back(detail.toTree());
    }
    node["details"] = details_node;
    return node;
}

std::string ErrorInfo::toReadableFormat(const std::size_t indent) const
{
    std::string result = target ? ("(" + *target + "): " + message) : message;

    const std::string details_indent(indent + 1, '\t');
    for (const auto& detail : details)
    {
        result += '\n';
        result += details_indent;
        result += detail.toReadableFormat(indent + 1);
    }
    return result;
}

ErrorInfo ErrorInfo::fromException(const std::exception& ex)
{
    return ErrorInfo{ex.what(), engine::demangle(typeid(ex).name()), cetl::nullopt, {}};
}

ErrorInfo ErrorInfo::invalidType(const std::string&          expected,
                                 const std::string&          actual,
                                 cetl::optional<std::string> target)
{
    return ErrorInfo{"Invalid type, expected " + expected + ", got " + actual,
                     "invalid_type",
                     std::move(target),
                     {}};
}

ErrorInfo ErrorInfo::wrap(std::string message, std::string code, cetl::optional<std::string> target, ErrorInfo cause)
{
    ErrorInfo parent{std::move(message), std::move(code), std::move(target), {}};
    parent.details.push_back(std::move(cause));
    return parent;
}

Error::Error(ErrorInfo info)
    : std::runtime_error{info.toReadableFormat()}
    , info_{std::move(info)}
{
}

}  // namespace treeconv
