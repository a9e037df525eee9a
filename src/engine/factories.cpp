//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/factories.hpp"

#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/converters.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/object_converter.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace treeconv
{
namespace
{

class TupleConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if ((type.kind() != TypeKind::Tuple) || type.args().empty())
        {
            return nullptr;
        }
        std::vector<Converter::Ptr> converters;
        converters.reserve(type.args().size());
        for (const auto& arg : type.args())
        {
            converters.push_back(context.getConverter(arg));
        }
        return makeTupleConverter(type, std::move(converters));
    }

};  // TupleConverterFactory

class SequenceConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if ((type.kind() != TypeKind::Sequence) || type.args().empty())
        {
            return nullptr;
        }
        return makeSequenceConverter(type, context.getConverter(type.args().front()));
    }

};  // SequenceConverterFactory

/// Mapping arguments are the key and value types; keys pass through as strings.
///
class MappingConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if ((type.kind() != TypeKind::Mapping) || type.args().empty())
        {
            return nullptr;
        }
        return makeMappingConverter(type, context.getConverter(type.args().back()));
    }

};  // MappingConverterFactory

class SetConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if ((type.kind() != TypeKind::Set) || type.args().empty())
        {
            return nullptr;
        }
        return makeSetConverter(type, context.getConverter(type.args().front()));
    }

};  // SetConverterFactory

class EnumConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context&) const override
    {
        if (type.kind() != TypeKind::Enum)
        {
            return nullptr;
        }
        return makeEnumConverter(type);
    }

};  // EnumConverterFactory

// MARK: -

class ObjectConverterFactory final : public ConverterFactory
{
public:
    ObjectConverterFactory(const MissingTypePolicy missing_type_policy, const bool dump_null_values)
        : missing_type_policy_{missing_type_policy}
        , dump_null_values_{dump_null_values}
    {
    }

    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if (type.kind() != TypeKind::Object)
        {
            return nullptr;
        }
        const auto* const shape = cetl::get_if<ObjectShape>(&type.shape());
        if (shape == nullptr)
        {
            return nullptr;
        }

        std::vector<AttributeDefinition> definitions;
        definitions.reserve(shape->parameters.size());
        for (const auto& parameter : shape->parameters)
        {
            const auto parameter_type = resolveParameterType(type, parameter);
            definitions.push_back(makeAttributeDefinition(parameter, parameter_type, context));
        }
        return makeObjectConverter(type, std::move(definitions), dump_null_values_);
    }

private:
    TypeDescriptor resolveParameterType(const TypeDescriptor& type, const Parameter& parameter) const
    {
        if (parameter.type)
        {
            return parameter.type();
        }

        switch (missing_type_policy_)
        {
        case MissingTypePolicy::UseAny:
            return TypeDescriptor::any();
        case MissingTypePolicy::FromDefault:
            if (parameter.has_default && parameter.default_type)
            {
                return parameter.default_type();
            }
            throw ResolutionError{"Missing type information for type '" + type.name() + "' for parameter '" +
                                  parameter.name + "', and there is no default value to take the type from"};
        default:
            throw ResolutionError{"Missing type information for type '" + type.name() + "' for parameter '" +
                                  parameter.name + "'"};
        }
    }

    const MissingTypePolicy missing_type_policy_;
    const bool              dump_null_values_;

};  // ObjectConverterFactory

// MARK: -

class UnionConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if ((type.kind() != TypeKind::Union) || type.args().empty())
        {
            return nullptr;
        }
        std::vector<Converter::Ptr> converters;
        converters.reserve(type.args().size());
        for (const auto& arg : type.args())
        {
            converters.push_back(context.getConverter(arg));
        }
        return makeUnionConverter(type, std::move(converters));
    }

};  // UnionConverterFactory

class LiteralConverterFactory final : public ConverterFactory
{
public:
    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context&) const override
    {
        if (type.kind() != TypeKind::Literal)
        {
            return nullptr;
        }
        const auto* const shape = cetl::get_if<LiteralShape>(&type.shape());
        if (shape == nullptr)
        {
            return nullptr;
        }
        return makeLiteralConverter(shape->value, shape->object);
    }

};  // LiteralConverterFactory

// MARK: -

class DiscriminatedConverterFactory final : public ConverterFactory
{
public:
    DiscriminatedConverterFactory(std::vector<std::pair<std::string, TypeDescriptor>> tag_types,
                                  ConverterFactory::Ptr                               member_factory,
                                  std::string                                         tag_key)
        : tag_types_{std::move(tag_types)}
        , member_factory_{std::move(member_factory)}
        , tag_key_{std::move(tag_key)}
    {
    }

    Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const override
    {
        if (!isMapped(type))
        {
            return nullptr;
        }

        std::vector<DiscriminatedMember> members;
        members.reserve(tag_types_.size());
        for (const auto& tag_type : tag_types_)
        {
            auto converter = member_factory_->tryCreateConverter(tag_type.second, context);
            if (!converter)
            {
                throw ResolutionError{"Discriminated member '" + tag_type.first + "' of type '" +
                                      tag_type.second.name() + "' is declined by the member factory"};
            }
            members.push_back(DiscriminatedMember{tag_type.first, tag_type.second, std::move(converter)});
        }
        return makeDiscriminatedConverter(std::move(members), tag_key_);
    }

private:
    bool isMapped(const TypeDescriptor& type) const
    {
        for (const auto& tag_type : tag_types_)
        {
            if (tag_type.second == type)
            {
                return true;
            }
        }
        return false;
    }

    const std::vector<std::pair<std::string, TypeDescriptor>> tag_types_;
    const ConverterFactory::Ptr                               member_factory_;
    const std::string                                         tag_key_;

};  // DiscriminatedConverterFactory

}  // namespace

ConverterFactory::Ptr makeTupleConverterFactory()
{
    return std::make_shared<TupleConverterFactory>();
}

ConverterFactory::Ptr makeSequenceConverterFactory()
{
    return std::make_shared<SequenceConverterFactory>();
}

ConverterFactory::Ptr makeMappingConverterFactory()
{
    return std::make_shared<MappingConverterFactory>();
}

ConverterFactory::Ptr makeSetConverterFactory()
{
    return std::make_shared<SetConverterFactory>();
}

ConverterFactory::Ptr makeEnumConverterFactory()
{
    return std::make_shared<EnumConverterFactory>();
}

ConverterFactory::Ptr makeObjectConverterFactory(const MissingTypePolicy missing_type_policy, const bool dump_null_values)
{
    return std::make_shared<ObjectConverterFactory>(missing_type_policy, dump_null_values);
}

ConverterFactory::Ptr makeUnionConverterFactory()
{
    return std::make_shared<UnionConverterFactory>();
}

ConverterFactory::Ptr makeLiteralConverterFactory()
{
    return std::make_shared<LiteralConverterFactory>();
}

ConverterFactory::Ptr makeDiscriminatedConverterFactory(std::vector<std::pair<std::string, TypeDescriptor>> tag_types,
                                                        ConverterFactory::Ptr                               member_factory,
                                                        std::string                                         tag_key)
{
    return std::make_shared<DiscriminatedConverterFactory>(std::move(tag_types),
                                                           std::move(member_factory),
                                                           std::move(tag_key));
}

std::vector<ConverterFactory::Ptr> makeDefaultFactories(const Context::Options& options)
{
    return {
        makeTupleConverterFactory(),
        makeSequenceConverterFactory(),
        makeMappingConverterFactory(),
        makeSetConverterFactory(),
        makeEnumConverterFactory(),
        makeObjectConverterFactory(options.missing_type_policy, options.dump_null_values),
        makeUnionConverterFactory(),
        makeLiteralConverterFactory(),
    };
}

}  // namespace treeconv
