//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_TYPES_HPP_INCLUDED
#define TREECONV_TYPES_HPP_INCLUDED

#include "errors.hpp"
#include "object.hpp"
#include "tree.hpp"
#include "type_descriptor.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treeconv
{

/// Describes the C++ type `T` to the conversion engine.
///
/// Specialize it for own object and enum types, with a static `make()` returning the descriptor
/// (usually built by `ObjectTypeBuilder` or `EnumTypeBuilder`). The `make()` must not
/// call `typeOf` for its own type, neither directly nor through a container of it:
/// refer to it via the deferred parameter types only.
///
template <typename T, typename Enable = void>
struct TypeOf;

/// Gets the (memoized) descriptor of the C++ type `T`.
///
template <typename T>
TypeDescriptor typeOf()
{
    static const TypeDescriptor descriptor = TypeOf<T>::make();
    return descriptor;
}

namespace detail
{

template <typename T>
struct ObjectCast
{
    static bool holds(const Object& value)
    {
        return std::any_cast<T>(&value) != nullptr;
    }

    static T take(Object&& value)
    {
        return std::any_cast<T>(std::move(value));
    }

    static Object make(const T& value)
    {
        return Object{value};
    }
};

/// The None value is an empty object.
///
template <>
struct ObjectCast<std::nullptr_t>
{
    static bool holds(const Object& value)
    {
        return !value.has_value() || (std::any_cast<std::nullptr_t>(&value) != nullptr);
    }

    static std::nullptr_t take(Object&&)
    {
        return nullptr;
    }

    static Object make(const std::nullptr_t)
    {
        return Object{};
    }
};

template <>
struct ObjectCast<Object>
{
    static bool holds(const Object&)
    {
        return true;
    }

    static Object take(Object&& value)
    {
        return std::move(value);
    }

    static Object make(const Object& value)
    {
        return value;
    }
};

template <typename T>
bool holds(const Object& value)
{
    return ObjectCast<T>::holds(value);
}

/// @throws std::bad_any_cast if the object holds another type.
///
template <typename T>
T objectCast(Object&& value)
{
    return ObjectCast<T>::take(std::move(value));
}

template <typename T>
Object toObject(const T& value)
{
    return ObjectCast<T>::make(value);
}

inline std::string joinNames(const std::vector<TypeDescriptor>& types)
{
    std::string result;
    for (const auto& type : types)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += type.name();
    }
    return result;
}

template <typename Items, typename Item>
std::vector<Object> itemsOf(const Items& items)
{
    std::vector<Object> result;
    result.reserve(items.size());
    for (const auto& item : items)
    {
        result.push_back(toObject<Item>(item));
    }
    return result;
}

template <typename Map>
MappingShape mappingShape()
{
    using Value = typename Map::mapped_type;

    MappingShape shape;
    shape.build = [](MappingShape::Entries&& entries) -> Object {
        Map result;
        for (auto& entry : entries)
        {
            result.emplace(std::move(entry.first), objectCast<Value>(std::move(entry.second)));
        }
        return Object{std::move(result)};
    };
    shape.entries = [](const Object& value) -> cetl::optional<MappingShape::Entries> {
        const auto* const map = std::any_cast<Map>(&value);
        if (map == nullptr)
        {
            return cetl::nullopt;
        }
        MappingShape::Entries entries;
        entries.reserve(map->size());
        for (const auto& entry : *map)
        {
            entries.emplace_back(entry.first, toObject<Value>(entry.second));
        }
        return entries;
    };
    return shape;
}

/// Union of `T` and None over a nullable holder (`cetl::optional` or `std::shared_ptr`).
///
template <typename Holder, typename T>
TypeDescriptor makeNullableType(std::function<Holder(T&&)> hold)
{
    UnionShape shape;
    shape.wrap = [hold](Object&& member_value) -> cetl::optional<Object> {
        if (!member_value.has_value())
        {
            return Object{Holder{}};
        }
        if (!holds<T>(member_value))
        {
            return cetl::nullopt;
        }
        return Object{hold(objectCast<T>(std::move(member_value)))};
    };
    shape.unwrap = [](const Object& value) -> cetl::optional<Object> {
        const auto* const holder = std::any_cast<Holder>(&value);
        if (holder == nullptr)
        {
            return cetl::nullopt;
        }
        if (!*holder)
        {
            return Object{};
        }
        return toObject<T>(**holder);
    };
    shape.runtime_type = [](const Object& value) -> cetl::optional<TypeDescriptor> {
        const auto* const holder = std::any_cast<Holder>(&value);
        if ((holder == nullptr) || !*holder)
        {
            return TypeDescriptor::primitive(PrimitiveKind::None);
        }
        return typeOf<T>();
    };

    std::vector<TypeDescriptor> args{typeOf<T>(), TypeDescriptor::primitive(PrimitiveKind::None)};
    auto                        name = "Optional[" + args.front().name() + "]";
    return TypeDescriptor::make(TypeKind::Union, std::move(name), typeid(Holder), std::move(args), std::move(shape));
}

}  // namespace detail

// MARK: - Primitives

template <>
struct TypeOf<std::nullptr_t>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::None);
    }
};

template <>
struct TypeOf<bool>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::Bool);
    }
};

template <>
struct TypeOf<std::int64_t>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::Integer);
    }
};

template <>
struct TypeOf<double>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::Float);
    }
};

template <>
struct TypeOf<std::string>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::String);
    }
};

template <>
struct TypeOf<Bytes>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::Bytes);
    }
};

template <>
struct TypeOf<Timestamp>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::primitive(PrimitiveKind::Timestamp);
    }
};

/// The data tree itself is the dynamic type.
///
template <>
struct TypeOf<Tree>
{
    static TypeDescriptor make()
    {
        return TypeDescriptor::any();
    }
};

// MARK: - Containers

template <typename T>
struct TypeOf<std::vector<T>>
{
    static TypeDescriptor make()
    {
        SequenceShape shape;
        shape.build = [](std::vector<Object>&& items) -> Object {
            std::vector<T> result;
            result.reserve(items.size());
            for (auto& item : items)
            {
                result.push_back(detail::objectCast<T>(std::move(item)));
            }
            return Object{std::move(result)};
        };
        shape.items = [](const Object& value) -> cetl::optional<std::vector<Object>> {
            const auto* const items = std::any_cast<std::vector<T>>(&value);
            if (items == nullptr)
            {
                return cetl::nullopt;
            }
            return detail::itemsOf<std::vector<T>, T>(*items);
        };

        const auto item_type = typeOf<T>();
        return TypeDescriptor::make(TypeKind::Sequence,
                                    "list[" + item_type.name() + "]",
                                    typeid(std::vector<T>),
                                    {item_type},
                                    std::move(shape));
    }
};

template <typename T>
struct TypeOf<std::set<T>>
{
    static TypeDescriptor make()
    {
        SetShape shape;
        shape.build = [](std::vector<Object>&& items) -> Object {
            std::set<T> result;
            for (auto& item : items)
            {
                result.insert(detail::objectCast<T>(std::move(item)));
            }
            return Object{std::move(result)};
        };
        shape.items = [](const Object& value) -> cetl::optional<std::vector<Object>> {
            const auto* const items = std::any_cast<std::set<T>>(&value);
            if (items == nullptr)
            {
                return cetl::nullopt;
            }
            return detail::itemsOf<std::set<T>, T>(*items);
        };

        const auto item_type = typeOf<T>();
        return TypeDescriptor::make(TypeKind::Set,
                                    "set[" + item_type.name() + "]",
                                    typeid(std::set<T>),
                                    {item_type},
                                    std::move(shape));
    }
};

template <typename V>
struct TypeOf<std::map<std::string, V>>
{
    static TypeDescriptor make()
    {
        const auto value_type = typeOf<V>();
        return TypeDescriptor::make(TypeKind::Mapping,
                                    "dict[str, " + value_type.name() + "]",
                                    typeid(std::map<std::string, V>),
                                    {typeOf<std::string>(), value_type},
                                    detail::mappingShape<std::map<std::string, V>>());
    }
};

template <typename V>
struct TypeOf<std::unordered_map<std::string, V>>
{
    static TypeDescriptor make()
    {
        const auto value_type = typeOf<V>();
        return TypeDescriptor::make(TypeKind::Mapping,
                                    "dict[str, " + value_type.name() + "]",
                                    typeid(std::unordered_map<std::string, V>),
                                    {typeOf<std::string>(), value_type},
                                    detail::mappingShape<std::unordered_map<std::string, V>>());
    }
};

template <typename... Ts>
struct TypeOf<std::tuple<Ts...>>
{
    static TypeDescriptor make()
    {
        TupleShape shape;
        shape.build = [](std::vector<Object>&& items) -> Object {
            return build(std::move(items), std::index_sequence_for<Ts...>{});
        };
        shape.items = [](const Object& value) -> cetl::optional<std::vector<Object>> {
            const auto* const tuple = std::any_cast<std::tuple<Ts...>>(&value);
            if (tuple == nullptr)
            {
                return cetl::nullopt;
            }
            return items(*tuple, std::index_sequence_for<Ts...>{});
        };

        std::vector<TypeDescriptor> args{typeOf<Ts>()...};
        auto                        name = "tuple[" + detail::joinNames(args) + "]";
        return TypeDescriptor::make(TypeKind::Tuple,
                                    std::move(name),
                                    typeid(std::tuple<Ts...>),
                                    std::move(args),
                                    std::move(shape));
    }

private:
    template <std::size_t... Is>
    static Object build(std::vector<Object>&& items, std::index_sequence<Is...>)
    {
        if (items.size() != sizeof...(Ts))
        {
            throw std::invalid_argument{"Unexpected number of tuple items."};
        }
        return Object{std::tuple<Ts...>{detail::objectCast<Ts>(std::move(items[Is]))...}};
    }

    template <std::size_t... Is>
    static std::vector<Object> items(const std::tuple<Ts...>& tuple, std::index_sequence<Is...>)
    {
        return {detail::toObject<Ts>(std::get<Is>(tuple))...};
    }
};

// MARK: - Unions

template <typename T>
struct TypeOf<cetl::optional<T>>
{
    static TypeDescriptor make()
    {
        return detail::makeNullableType<cetl::optional<T>, T>([](T&& value) {
            return cetl::optional<T>{std::move(value)};
        });
    }
};

template <typename T>
struct TypeOf<std::shared_ptr<T>>
{
    static TypeDescriptor make()
    {
        return detail::makeNullableType<std::shared_ptr<T>, T>([](T&& value) {
            return std::make_shared<T>(std::move(value));
        });
    }
};

/// Untagged union over the alternatives, tried in declaration order.
///
template <typename... Ts>
struct TypeOf<cetl::variant<Ts...>>
{
    using Variant = cetl::variant<Ts...>;

    static TypeDescriptor make()
    {
        UnionShape shape;
        shape.wrap = [](Object&& member_value) -> cetl::optional<Object> {
            using Wrapper = cetl::optional<Object> (*)(Object&);
            const Wrapper wrappers[] = {&wrapAs<Ts>...};
            for (const auto wrapper : wrappers)
            {
                if (auto value = wrapper(member_value))
                {
                    return value;
                }
            }
            return cetl::nullopt;
        };
        shape.unwrap = [](const Object& value) -> cetl::optional<Object> {
            const auto* const variant = std::any_cast<Variant>(&value);
            if (variant == nullptr)
            {
                return cetl::nullopt;
            }
            return cetl::visit(
                [](const auto& alternative) {
                    using Alternative = std::decay_t<decltype(alternative)>;
                    return detail::toObject<Alternative>(alternative);
                },
                *variant);
        };
        shape.runtime_type = [](const Object& value) -> cetl::optional<TypeDescriptor> {
            const auto* const variant = std::any_cast<Variant>(&value);
            if (variant == nullptr)
            {
                return cetl::nullopt;
            }
            return cetl::visit(
                [](const auto& alternative) {
                    using Alternative = std::decay_t<decltype(alternative)>;
                    return typeOf<Alternative>();
                },
                *variant);
        };

        std::vector<TypeDescriptor> args{typeOf<Ts>()...};
        auto                        name = "Union[" + detail::joinNames(args) + "]";
        return TypeDescriptor::make(TypeKind::Union, std::move(name), typeid(Variant), std::move(args), std::move(shape));
    }

private:
    template <typename Alternative>
    static cetl::optional<Object> wrapAs(Object& member_value)
    {
        if (!detail::holds<Alternative>(member_value))
        {
            return cetl::nullopt;
        }
        return Object{Variant{detail::objectCast<Alternative>(std::move(member_value))}};
    }
};

// MARK: - Objects

/// Declares an object type: its parameters (in construct order) and how to construct it.
///
/// Parameters declared with a member pointer are assigned to a default constructed instance,
/// and are read back off an instance on dump. Types which are not default constructible
/// need a `construct` callable.
///
/// The per attribute modifiers (`alias`, `injectKey`, `leftovers`, `getter`, `untyped` and `loadOnly`)
/// apply to the most recently declared parameter.
///
/// ```
/// template <>
/// struct TypeOf<Node>
/// {
///     static TypeDescriptor make()
///     {
///         return ObjectTypeBuilder<Node>{"Node"}.param("value", &Node::value).optional("next", &Node::next).build();
///     }
/// };
/// ```
///
template <typename T>
class ObjectTypeBuilder final
{
public:
    explicit ObjectTypeBuilder(std::string name)
        : name_{std::move(name)}
    {
    }

    /// Declares a required parameter.
    ///
    template <typename M>
    ObjectTypeBuilder& param(std::string name, M T::*const member)
    {
        addMember(std::move(name), member, false);
        return *this;
    }

    /// Declares a parameter which falls back to the member's default when absent in the data.
    ///
    template <typename M>
    ObjectTypeBuilder& optional(std::string name, M T::*const member)
    {
        addMember(std::move(name), member, true);
        return *this;
    }

    /// Declares a required parameter of a `construct` callable, not bound to any member.
    ///
    ObjectTypeBuilder& argument(std::string name, TypeThunk type)
    {
        Parameter parameter;
        parameter.name = std::move(name);
        parameter.type = std::move(type);
        parameters_.push_back(std::move(parameter));
        return *this;
    }

    /// Declares a parameter of a `construct` callable with a default value.
    ///
    template <typename M>
    ObjectTypeBuilder& argument(std::string name, TypeThunk type, const M& default_value)
    {
        argument(std::move(name), std::move(type));
        auto& parameter         = parameters_.back();
        parameter.has_default   = true;
        parameter.default_value = detail::toObject<M>(default_value);
        parameter.default_type  = [] { return typeOf<M>(); };
        return *this;
    }

    ObjectTypeBuilder& alias(std::string alias)
    {
        last().options.aliases.push_back(std::move(alias));
        return *this;
    }

    ObjectTypeBuilder& injectKey()
    {
        last().options.inject_key = true;
        return *this;
    }

    ObjectTypeBuilder& leftovers()
    {
        last().options.inject_leftovers = true;
        return *this;
    }

    ObjectTypeBuilder& getter(std::function<cetl::optional<Object>(const T& instance)> read)
    {
        last().options.getter = [read = std::move(read)](const Object& instance) -> cetl::optional<Object> {
            const auto* const typed = std::any_cast<T>(&instance);
            if (typed == nullptr)
            {
                return cetl::nullopt;
            }
            return read(*typed);
        };
        return *this;
    }

    /// Drops the type information of the parameter (see `MissingTypePolicy`).
    ///
    ObjectTypeBuilder& untyped()
    {
        last().type = nullptr;
        return *this;
    }

    /// The parameter is never dumped.
    ///
    ObjectTypeBuilder& loadOnly()
    {
        last().getter         = nullptr;
        last().options.getter = nullptr;
        return *this;
    }

    /// Replaces the default "construct and assign members" with a callable.
    ///
    /// The callable extracts its arguments with `Arguments::take` (or `takeOr`).
    ///
    ObjectTypeBuilder& construct(std::function<T(Arguments& arguments)> construct)
    {
        construct_ = std::move(construct);
        return *this;
    }

    CETL_NODISCARD TypeDescriptor build() const
    {
        ObjectShape shape;
        shape.parameters = parameters_;
        if (construct_)
        {
            shape.construct = [construct = construct_](Arguments& arguments) -> Object {
                return Object{construct(arguments)};
            };
        }
        else
        {
            shape.construct = defaultConstruct(std::is_default_constructible<T>{});
        }
        return TypeDescriptor::make(TypeKind::Object, name_, typeid(T), {}, std::move(shape));
    }

private:
    using Assign = std::function<void(T& instance, Arguments& arguments)>;

    Parameter& last()
    {
        if (parameters_.empty())
        {
            throw std::logic_error{"Object type '" + name_ + "' has no parameters to modify."};
        }
        return parameters_.back();
    }

    template <typename M>
    void addMember(std::string name, M T::*const member, const bool has_default)
    {
        Parameter parameter;
        parameter.name   = name;
        parameter.type   = [] { return typeOf<M>(); };
        parameter.getter = [member](const Object& instance) -> cetl::optional<Object> {
            const auto* const typed = std::any_cast<T>(&instance);
            if (typed == nullptr)
            {
                return cetl::nullopt;
            }
            return detail::toObject<M>(typed->*member);
        };
        if (has_default)
        {
            parameter.has_default   = true;
            parameter.default_value = defaultOf(member, std::is_default_constructible<T>{});
            parameter.default_type  = [] { return typeOf<M>(); };
        }
        parameters_.push_back(std::move(parameter));

        assigns_.push_back([name = std::move(name), member, has_default](T& instance, Arguments& arguments) {
            if (arguments.contains(name))
            {
                instance.*member = detail::objectCast<M>(*arguments.takeObject(name));
            }
            else if (!has_default)
            {
                throw MissingArgumentError{name};
            }
        });
    }

    template <typename M>
    static Object defaultOf(M T::*const member, std::true_type)
    {
        const T instance{};
        return detail::toObject<M>(instance.*member);
    }

    template <typename M>
    static Object defaultOf(M T::*, std::false_type)
    {
        return Object{};
    }

    std::function<Object(Arguments&)> defaultConstruct(std::true_type) const
    {
        return [assigns = assigns_](Arguments& arguments) -> Object {
            T instance{};
            for (const auto& assign : assigns)
            {
                assign(instance, arguments);
            }
            return Object{std::move(instance)};
        };
    }

    // Not constructible without a `construct` callable.
    std::function<Object(Arguments&)> defaultConstruct(std::false_type) const
    {
        return nullptr;
    }

    std::string                            name_;
    std::vector<Parameter>                 parameters_;
    std::vector<Assign>                    assigns_;
    std::function<T(Arguments& arguments)> construct_;

};  // ObjectTypeBuilder

// MARK: - Enums

/// Declares an enumeration type.
///
/// Enumerants are represented in the data by their underlying values, unless another scalar is given
/// (like `value("B", E::B, "2")`).
///
template <typename E>
class EnumTypeBuilder final
{
    static_assert(std::is_enum<E>::value, "Enumeration type is expected.");

public:
    explicit EnumTypeBuilder(std::string name)
        : name_{std::move(name)}
    {
    }

    EnumTypeBuilder& value(std::string name, const E value)
    {
        const auto underlying = static_cast<std::int64_t>(value);
        return this->value(std::move(name), value, tree::makeInteger(underlying));
    }

    EnumTypeBuilder& value(std::string name, const E value, const std::string& data)
    {
        return this->value(std::move(name), value, tree::makeString(data));
    }

    EnumTypeBuilder& value(std::string name, const E value, Tree data)
    {
        shape_.enumerants.push_back({std::move(name), static_cast<std::int64_t>(value), std::move(data)});
        return *this;
    }

    /// Values may be any bitwise combination of the enumerants.
    ///
    EnumTypeBuilder& flags()
    {
        shape_.is_flag = true;
        return *this;
    }

    CETL_NODISCARD TypeDescriptor build() const
    {
        auto shape       = shape_;
        shape.from_value = [](const std::int64_t value) -> Object {
            return Object{static_cast<E>(value)};
        };
        shape.to_value = [](const Object& value) -> cetl::optional<std::int64_t> {
            const auto* const enumerant = std::any_cast<E>(&value);
            if (enumerant == nullptr)
            {
                return cetl::nullopt;
            }
            return static_cast<std::int64_t>(*enumerant);
        };
        return TypeDescriptor::make(TypeKind::Enum, name_, typeid(E), {}, std::move(shape));
    }

private:
    std::string name_;
    EnumShape   shape_;

};  // EnumTypeBuilder

// MARK: - Literals

namespace detail
{

inline Tree literalTree(const bool value)
{
    return tree::makeBool(value);
}

inline Tree literalTree(const std::int64_t value)
{
    return tree::makeInteger(value);
}

inline Tree literalTree(const double value)
{
    return tree::makeFloat(value);
}

inline Tree literalTree(const std::string& value)
{
    return tree::makeString(value);
}

template <typename T>
TypeDescriptor makeLiteral(const T& value)
{
    LiteralShape shape;
    shape.value  = literalTree(value);
    shape.object = toObject<T>(value);

    const std::string text          = shape.value.Scalar();
    std::string       discriminator = tree::kindName(shape.value);
    discriminator += ':';
    discriminator += text;
    return TypeDescriptor::make(TypeKind::Literal,
                                "Literal[" + text + "]",
                                typeid(T),
                                {},
                                std::move(shape),
                                std::move(discriminator));
}

}  // namespace detail

/// Describes a constant value: loads only the equal data, dumps the constant.
///
CETL_NODISCARD inline TypeDescriptor literal(const bool value)
{
    return detail::makeLiteral(value);
}

CETL_NODISCARD inline TypeDescriptor literal(const std::int64_t value)
{
    return detail::makeLiteral(value);
}

CETL_NODISCARD inline TypeDescriptor literal(const int value)
{
    return detail::makeLiteral(static_cast<std::int64_t>(value));
}

CETL_NODISCARD inline TypeDescriptor literal(const double value)
{
    return detail::makeLiteral(value);
}

CETL_NODISCARD inline TypeDescriptor literal(const std::string& value)
{
    return detail::makeLiteral(value);
}

CETL_NODISCARD inline TypeDescriptor literal(const char* const value)
{
    return detail::makeLiteral(std::string{value});
}

}  // namespace treeconv

#endif  // TREECONV_TYPES_HPP_INCLUDED
