//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/treeconv.hpp"

#include "engine_helpers.hpp"
#include "logging.hpp"
#include "setup_logging.hpp"
#include "treeconv/config.hpp"
#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <utility>

namespace treeconv
{

Object load(Context& context, const TypeDescriptor& type, const Tree& data, const Key& key)
{
    const auto converter = context.getConverter(type);

    auto result = converter->load(data, key, context);
    if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
    {
        common::getLogger("treeconv")->debug("Failed to load '{}': {}", type.name(), err->message);
        throw LoadError{std::move(*err)};
    }
    return std::move(cetl::get<LoadResult::Success>(result));
}

Tree dump(Context& context, const TypeDescriptor& type, const Object& value)
{
    const auto converter = context.getConverter(type);

    auto result = converter->dump(value, context);
    if (auto* const err = cetl::get_if<DumpResult::Failure>(&result))
    {
        common::getLogger("treeconv")->debug("Failed to dump '{}': {}", type.name(), err->message);
        throw DumpError{std::move(*err)};
    }
    return cetl::get<DumpResult::Success>(result);
}

Context::Ptr makeContext(const Config& config)
{
    common::setupLogging(config);
    return Context::make(Context::Options::from(config));
}

Context& defaultContext()
{
    static const auto context = Context::make();
    return *context;
}

namespace detail
{

void throwLoadedTypeMismatch(const TypeDescriptor& type, const Object& value, const Key& key)
{
    throw LoadError{ErrorInfo::invalidType(type.name(), engine::typeNameOf(value), key.target())};
}

}  // namespace detail

}  // namespace treeconv
