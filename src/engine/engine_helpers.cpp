//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine_helpers.hpp"

#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <yaml-cpp/yaml.h>

#include <any>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <string>

namespace treeconv
{
namespace engine
{

std::string demangle(const char* const mangled_name)
{
    int  status = 0;
    auto demangled =
        std::unique_ptr<char, void (*)(void*)>{abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status),
                                               std::free};
    if ((status == 0) && demangled)
    {
        return demangled.get();
    }
    return mangled_name;
}

std::string typeNameOf(const Object& value)
{
    if (!value.has_value())
    {
        return "None";
    }
    return demangle(value.type().name());
}

std::string describe(const Tree& data)
{
    if (!data.IsDefined())
    {
        return "null";
    }
    YAML::Emitter emitter;
    emitter.SetMapFormat(YAML::Flow);
    emitter.SetSeqFormat(YAML::Flow);
    emitter << data;
    return emitter.c_str();
}

cetl::optional<Tree> treeOfScalar(const Object& value)
{
    if (!value.has_value())
    {
        return tree::makeNull();
    }
    if (const auto* const node = std::any_cast<Tree>(&value))
    {
        return YAML::Clone(*node);
    }
    if (std::any_cast<std::nullptr_t>(&value) != nullptr)
    {
        return tree::makeNull();
    }
    if (const auto* const flag = std::any_cast<bool>(&value))
    {
        return tree::makeBool(*flag);
    }
    if (const auto* const integer = std::any_cast<std::int64_t>(&value))
    {
        return tree::makeInteger(*integer);
    }
    if (const auto* const integer = std::any_cast<int>(&value))
    {
        return tree::makeInteger(*integer);
    }
    if (const auto* const real = std::any_cast<double>(&value))
    {
        return tree::makeFloat(*real);
    }
    if (const auto* const text = std::any_cast<std::string>(&value))
    {
        return tree::makeString(*text);
    }
    if (const auto* const text = std::any_cast<const char*>(&value))
    {
        return tree::makeString(*text);
    }
    return cetl::nullopt;
}

}  // namespace engine
}  // namespace treeconv
