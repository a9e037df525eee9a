//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/type_descriptor.hpp"

#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace treeconv
{

struct TypeDescriptor::Info final
{
    TypeKind                    kind;
    std::string                 name;
    std::type_index             type_index;
    std::vector<TypeDescriptor> args;
    Shape                       shape;
    std::string                 discriminator;

};  // Info

namespace
{

TypeDescriptor makePrimitive(const PrimitiveKind kind, const char* const name, const std::type_info& type)
{
    return TypeDescriptor::make(TypeKind::Primitive, name, std::type_index{type}, {}, PrimitiveShape{kind});
}

}  // namespace

TypeDescriptor TypeDescriptor::make(const TypeKind              kind,
                                    std::string                 name,
                                    const std::type_index       type_index,
                                    std::vector<TypeDescriptor> args,
                                    Shape                       shape,
                                    std::string                 discriminator)
{
    return TypeDescriptor{std::make_shared<const Info>(
        Info{kind, std::move(name), type_index, std::move(args), std::move(shape), std::move(discriminator)})};
}

TypeDescriptor TypeDescriptor::any()
{
    static const auto descriptor = make(TypeKind::Any, "Any", std::type_index{typeid(Tree)}, {}, AnyShape{});
    return descriptor;
}

TypeDescriptor TypeDescriptor::primitive(const PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::None:
    {
        static const auto descriptor = makePrimitive(kind, "None", typeid(std::nullptr_t));
        return descriptor;
    }
    case PrimitiveKind::Bool:
    {
        static const auto descriptor = makePrimitive(kind, "bool", typeid(bool));
        return descriptor;
    }
    case PrimitiveKind::Integer:
    {
        static const auto descriptor = makePrimitive(kind, "int", typeid(std::int64_t));
        return descriptor;
    }
    case PrimitiveKind::Float:
    {
        static const auto descriptor = makePrimitive(kind, "float", typeid(double));
        return descriptor;
    }
    case PrimitiveKind::String:
    {
        static const auto descriptor = makePrimitive(kind, "str", typeid(std::string));
        return descriptor;
    }
    case PrimitiveKind::Bytes:
    {
        static const auto descriptor = makePrimitive(kind, "bytes", typeid(Bytes));
        return descriptor;
    }
    case PrimitiveKind::Timestamp:
    {
        static const auto descriptor = makePrimitive(kind, "timestamp", typeid(Timestamp));
        return descriptor;
    }
    }
    return makePrimitive(PrimitiveKind::None, "None", typeid(std::nullptr_t));
}

TypeKind TypeDescriptor::kind() const noexcept
{
    return info_->kind;
}

const std::string& TypeDescriptor::name() const noexcept
{
    return info_->name;
}

std::type_index TypeDescriptor::typeIndex() const noexcept
{
    return info_->type_index;
}

const std::vector<TypeDescriptor>& TypeDescriptor::args() const noexcept
{
    return info_->args;
}

const Shape& TypeDescriptor::shape() const noexcept
{
    return info_->shape;
}

std::size_t TypeDescriptor::hash() const noexcept
{
    constexpr std::size_t Prime = 31;

    std::size_t result = static_cast<std::size_t>(info_->kind);
    result             = (result * Prime) + info_->type_index.hash_code();
    result             = (result * Prime) + std::hash<std::string>{}(info_->discriminator);
    return result;
}

bool TypeDescriptor::operator==(const TypeDescriptor& other) const noexcept
{
    if (info_ == other.info_)
    {
        return true;
    }
    return (info_->kind == other.info_->kind) && (info_->type_index == other.info_->type_index) &&
           (info_->discriminator == other.info_->discriminator);
}

}  // namespace treeconv
