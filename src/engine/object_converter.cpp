//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/object_converter.hpp"

#include "engine_helpers.hpp"
#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_set>
#include <utility>
#include <vector>

namespace treeconv
{
namespace
{

class ObjectConverter final : public Converter
{
public:
    ObjectConverter(const TypeDescriptor&            type,
                    const ObjectShape&               shape,
                    std::vector<AttributeDefinition> attributes,
                    const bool                       dump_null_values)
        : type_name_{type.name()}
        , type_index_{type.typeIndex()}
        , construct_{shape.construct}
        , attributes_{std::move(attributes)}
        , dump_null_values_{dump_null_values}
    {
        for (const auto& attribute : attributes_)
        {
            data_keys_.insert(attribute.data_key);
            data_keys_.insert(attribute.aliases.begin(), attribute.aliases.end());
            has_leftovers_ = has_leftovers_ || attribute.inject_leftovers;
        }
    }

    // `load` and `dump` recurse through nested objects: their frames hold the success path values only,
    // failures are built by the helpers below.

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        const auto kind = tree::kindOf(data);
        if (kind != tree::NodeKind::Map)
        {
            return notAMapError(kind, key);
        }

        Arguments arguments;
        for (const auto& attribute : attributes_)
        {
            if (attribute.inject_leftovers)
            {
                continue;
            }

            const auto raw_value = lookup(data, attribute);
            if (raw_value && attribute.converter)
            {
                auto result = attribute.converter->load(*raw_value, Key{attribute.name}, context);
                if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
                {
                    return attributeFailure(attribute, std::move(*err));
                }
                arguments.set(attribute.name, std::move(cetl::get<LoadResult::Success>(result)));
            }
            else
            {
                supplyAbsent(attribute, key, arguments, context);
            }
        }

        if (has_leftovers_)
        {
            return constructWithLeftovers(data, arguments, context);
        }
        return construct(arguments);
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        if (!value.has_value() || (std::type_index{value.type()} != type_index_))
        {
            return notThisTypeError(value);
        }

        auto              node = tree::makeMap();
        std::vector<Tree> leftovers;
        for (const auto& attribute : attributes_)
        {
            if (!attribute.converter || !attribute.getter)
            {
                // Load only attribute.
                continue;
            }

            auto attribute_value = getValue(attribute, value);
            if (auto* const err = cetl::get_if<DumpResult::Failure>(&attribute_value))
            {
                return attributeDumpError(attribute, std::move(*err));
            }
            const auto& maybe_value = cetl::get<cetl::optional<Object>>(attribute_value);
            if (!maybe_value)
            {
                continue;
            }

            auto result = attribute.converter->dump(*maybe_value, context);
            if (auto* const err = cetl::get_if<DumpResult::Failure>(&result))
            {
                return attributeDumpError(attribute, std::move(*err));
            }
            auto& raw_value = cetl::get<DumpResult::Success>(result);

            if (attribute.inject_leftovers)
            {
                if (tree::kindOf(raw_value) == tree::NodeKind::Map)
                {
                    leftovers.push_back(std::move(raw_value));
                }
                continue;
            }
            if (!dump_null_values_ && (tree::kindOf(raw_value) == tree::NodeKind::Null))
            {
                continue;
            }
            node[attribute.data_key] = raw_value;
        }

        for (const auto& extra : leftovers)
        {
            mergeLeftovers(node, extra);
        }
        return node;
    }

private:
    static cetl::optional<Tree> lookup(const Tree& data, const AttributeDefinition& attribute)
    {
        const auto value = data[attribute.data_key];
        if (value.IsDefined())
        {
            return value;
        }
        for (const auto& alias : attribute.aliases)
        {
            const auto alias_value = data[alias];
            if (alias_value.IsDefined())
            {
                return alias_value;
            }
        }
        return cetl::nullopt;
    }

    /// Collects the input keys not matched by any attribute, and passes them to the leftovers attributes.
    ///
    cetl::optional<ErrorInfo> injectLeftovers(const Tree& data, Arguments& arguments, Context& context) const
    {
        auto leftovers = tree::makeMap();
        for (const auto& entry : data)
        {
            const auto& entry_key = entry.first.Scalar();
            if (data_keys_.find(entry_key) == data_keys_.end())
            {
                leftovers[entry_key] = entry.second;
            }
        }

        for (const auto& attribute : attributes_)
        {
            if (!attribute.inject_leftovers)
            {
                continue;
            }
            if (!attribute.converter)
            {
                arguments.set(attribute.name, Object{leftovers});
                continue;
            }

            auto result = attribute.converter->load(leftovers, Key{attribute.name}, context);
            if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
            {
                return attributeLoadError(attribute, std::move(*err));
            }
            arguments.set(attribute.name, std::move(cetl::get<LoadResult::Success>(result)));
        }
        return cetl::nullopt;
    }

    /// Declared keys are never overridden by leftovers.
    ///
    void mergeLeftovers(Tree& node, const Tree& extra) const
    {
        for (const auto& entry : extra)
        {
            const auto& entry_key = entry.first.Scalar();
            if (data_keys_.find(entry_key) != data_keys_.end())
            {
                continue;
            }
            const Tree& const_node = node;
            if (!const_node[entry_key].IsDefined())
            {
                node[entry_key] = entry.second;
            }
        }
    }

    /// An attribute absent from the data: provided, or the collection key, or omitted
    /// (the construct callable applies its own default, if any).
    ///
    static void supplyAbsent(const AttributeDefinition& attribute,
                             const Key&                 key,
                             Arguments&                 arguments,
                             Context&                   context)
    {
        if (attribute.provider)
        {
            arguments.set(attribute.name, attribute.provider->provide(context));
        }
        else if (attribute.inject_key && key.isPresent())
        {
            arguments.set(attribute.name, key.toObject());
        }
    }

    LoadResult::Var constructWithLeftovers(const Tree& data, Arguments& arguments, Context& context) const
    {
        if (auto failure = injectLeftovers(data, arguments, context))
        {
            return objectLoadError(std::move(*failure));
        }
        return construct(arguments);
    }

    LoadResult::Var attributeFailure(const AttributeDefinition& attribute, ErrorInfo cause) const
    {
        return objectLoadError(attributeLoadError(attribute, std::move(cause)));
    }

    LoadResult::Var construct(Arguments& arguments) const
    {
        try
        {
            return construct_(arguments);

        } catch (const LoadError& ex)
        {
            return objectLoadError(ex.info());

        } catch (const std::exception& ex)
        {
            return objectLoadError(ErrorInfo::fromException(ex));
        }
    }

    /// The attribute value, or nothing when it is not available.
    ///
    static cetl::variant<cetl::optional<Object>, ErrorInfo> getValue(const AttributeDefinition& attribute,
                                                                      const Object&              value)
    {
        try
        {
            return attribute.getter(value);

        } catch (const std::exception& ex)
        {
            return ErrorInfo::fromException(ex);
        }
    }

    static LoadResult::Var notAMapError(const tree::NodeKind kind, const Key& key)
    {
        if (kind == tree::NodeKind::Null)
        {
            return ErrorInfo{"Cannot load a None object", "none_load", key.target(), {}};
        }
        return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Map), tree::kindName(kind), key.target());
    }

    DumpResult::Var notThisTypeError(const Object& value) const
    {
        if (!value.has_value())
        {
            return ErrorInfo{"Expected object, got None", "none_dump", cetl::nullopt, {}};
        }
        return engine::invalidObjectType(type_name_, value);
    }

    static ErrorInfo attributeLoadError(const AttributeDefinition& attribute, ErrorInfo cause)
    {
        return ErrorInfo::wrap("Failed to load object attribute " + attribute.name,
                               "attr_load_error",
                               attribute.name,
                               std::move(cause));
    }

    static DumpResult::Var attributeDumpError(const AttributeDefinition& attribute, ErrorInfo cause)
    {
        return ErrorInfo::wrap("Failed to dump object attribute " + attribute.name,
                               "attribute_dump_error",
                               attribute.name,
                               std::move(cause));
    }

    ErrorInfo objectLoadError(ErrorInfo cause) const
    {
        return ErrorInfo::wrap("Failed to load object", "object_load_error", type_name_, std::move(cause));
    }

    const std::string                       type_name_;
    const std::type_index                   type_index_;
    const std::function<Object(Arguments&)> construct_;
    const std::vector<AttributeDefinition>  attributes_;
    const bool                              dump_null_values_;
    std::unordered_set<std::string>         data_keys_;
    bool                                    has_leftovers_{false};

};  // ObjectConverter

}  // namespace

AttributeDefinition makeAttributeDefinition(const Parameter& parameter, const TypeDescriptor& type, Context& context)
{
    AttributeDefinition definition;
    definition.name             = parameter.name;
    definition.data_key         = parameter.name;
    definition.aliases          = parameter.options.aliases;
    definition.inject_key       = parameter.options.inject_key;
    definition.inject_leftovers = parameter.options.inject_leftovers;
    definition.getter           = parameter.options.getter ? parameter.options.getter : parameter.getter;

    definition.provider = context.getProvider(type);
    if (!definition.provider)
    {
        definition.converter = context.getConverter(type);
    }
    return definition;
}

Converter::Ptr makeObjectConverter(const TypeDescriptor&            type,
                                   std::vector<AttributeDefinition> attributes,
                                   const bool                       dump_null_values)
{
    const auto* const shape = cetl::get_if<ObjectShape>(&type.shape());
    if ((shape == nullptr) || !shape->construct)
    {
        throw ResolutionError{"Type '" + type.name() + "' is not a constructible object."};
    }
    return std::make_shared<ObjectConverter>(type, *shape, std::move(attributes), dump_null_values);
}

}  // namespace treeconv
