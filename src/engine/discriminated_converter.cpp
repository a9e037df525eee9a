//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/converters.hpp"

#include "engine_helpers.hpp"
#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treeconv
{
namespace
{

class DiscriminatedConverter final : public Converter
{
public:
    DiscriminatedConverter(std::vector<DiscriminatedMember> members, std::string tag_key)
        : tag_key_{std::move(tag_key)}
    {
        for (auto& member : members)
        {
            dump_map_.emplace(member.type.typeIndex(), DumpEntry{member.tag, member.converter});
            load_map_.emplace(std::move(member.tag), std::move(member.converter));
        }
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        const auto kind = tree::kindOf(data);
        if ((kind != tree::NodeKind::Null) && (kind != tree::NodeKind::Map))
        {
            return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Map), tree::kindName(kind), key.target());
        }

        // Null is treated as an empty map, so it fails on the missing tag.
        cetl::optional<std::string> tag;
        if (kind == tree::NodeKind::Map)
        {
            const auto tag_node = data[tag_key_];
            if (tag_node.IsDefined() && tag_node.IsScalar())
            {
                tag = tag_node.Scalar();
            }
        }

        const auto it = tag ? load_map_.find(*tag) : load_map_.end();
        if (it == load_map_.end())
        {
            return ErrorInfo{"No registered converter found for discriminator " + tag_key_ + "=" +
                                 tag.value_or("None"),
                             "unknown_discriminator",
                             key.target(),
                             {}};
        }
        return it->second->load(data, key, context);
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        const auto it = dump_map_.find(std::type_index{value.type()});
        if (it == dump_map_.end())
        {
            return ErrorInfo{"Cannot determine discriminator value for type: " + engine::typeNameOf(value),
                             "unknown_discriminator",
                             cetl::nullopt,
                             {}};
        }
        const auto& entry = it->second;

        auto result = entry.converter->dump(value, context);
        if (auto* const node = cetl::get_if<DumpResult::Success>(&result))
        {
            if (tree::kindOf(*node) != tree::NodeKind::Map)
            {
                return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Map), tree::kindName(*node), cetl::nullopt);
            }
            (*node)[tag_key_] = tree::makeString(entry.tag);
        }
        return result;
    }

private:
    struct DumpEntry final
    {
        std::string    tag;
        Converter::Ptr converter;
    };

    const std::string                               tag_key_;
    std::unordered_map<std::string, Converter::Ptr> load_map_;
    std::unordered_map<std::type_index, DumpEntry>  dump_map_;

};  // DiscriminatedConverter

}  // namespace

Converter::Ptr makeDiscriminatedConverter(std::vector<DiscriminatedMember> members, std::string tag_key)
{
    for (const auto& member : members)
    {
        if (!member.converter)
        {
            throw ResolutionError{"No converter for discriminated member '" + member.tag + "'."};
        }
    }
    return std::make_shared<DiscriminatedConverter>(std::move(members), std::move(tag_key));
}

}  // namespace treeconv
