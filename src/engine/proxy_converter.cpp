//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "proxy_converter.hpp"

#include "logging.hpp"
#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"

#include <memory>
#include <mutex>
#include <utility>

namespace treeconv
{
namespace engine
{
namespace
{

class ProxyConverter final : public Converter
{
public:
    explicit ProxyConverter(TypeDescriptor type)
        : type_{std::move(type)}
        , logger_{common::getLogger("treeconv")}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        return target(context)->load(data, key, context);
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        return target(context)->dump(value, context);
    }

private:
    /// The real converter is owned by the context cache only; it usually owns this proxy in turn.
    ///
    Converter::Ptr target(Context& context) const
    {
        std::call_once(once_, [this, &context] {
            //
            target_ = context.getConverter(type_);
            logger_->trace("Proxy of '{}' is bound.", type_.name());
        });
        if (auto target = target_.lock())
        {
            return target;
        }
        return context.getConverter(type_);
    }

    const TypeDescriptor             type_;
    common::LoggerPtr                logger_;
    mutable std::once_flag           once_;
    mutable std::weak_ptr<Converter> target_;

};  // ProxyConverter

}  // namespace

Converter::Ptr makeProxyConverter(const TypeDescriptor& type)
{
    return std::make_shared<ProxyConverter>(type);
}

}  // namespace engine
}  // namespace treeconv
