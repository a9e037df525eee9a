//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_TYPE_DESCRIPTOR_HPP_INCLUDED
#define TREECONV_TYPE_DESCRIPTOR_HPP_INCLUDED

#include "object.hpp"
#include "tree.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace treeconv
{

class TypeDescriptor;

/// Generic origin of a described type.
///
enum class TypeKind : std::uint8_t
{
    Any,
    Primitive,
    Sequence,
    Set,
    Mapping,
    Tuple,
    Union,
    Enum,
    Object,
    Literal,
};

enum class PrimitiveKind : std::uint8_t
{
    None,
    Bool,
    Integer,
    Float,
    String,
    Bytes,
    Timestamp,
};

/// Deferred type reference; evaluated only at converter resolution time.
///
using TypeThunk = std::function<TypeDescriptor()>;

/// Reads an attribute value off an instance; `nullopt` means "not available".
///
using Getter = std::function<cetl::optional<Object>(const Object& instance)>;

/// Explicit per attribute conversion options.
///
struct AttributeOptions final
{
    /// Alternative data keys, looked up in order after the primary key.
    std::vector<std::string> aliases;

    /// The attribute receives the collection key of the object being loaded.
    bool inject_key{false};

    /// The attribute receives a map of all input keys not matched by any attribute.
    bool inject_leftovers{false};

    /// Overrides the parameter's own getter when dumping.
    Getter getter;

};  // AttributeOptions

/// A parameter of an object construct callable.
///
struct Parameter final
{
    std::string name;

    /// Empty when there is no type information for the parameter.
    TypeThunk type;

    bool   has_default{false};
    Object default_value;

    /// Type of the default value (if any); used by the "from default" missing type policy.
    TypeThunk default_type;

    /// Reads the attribute off an instance (for dumping); empty if the attribute is not readable.
    Getter getter;

    AttributeOptions options;

};  // Parameter

// MARK: - Shapes: per kind hooks into the concrete C++ type.

struct AnyShape final
{};

struct PrimitiveShape final
{
    PrimitiveKind kind;
};

struct SequenceShape final
{
    std::function<Object(std::vector<Object>&& items)>                  build;
    std::function<cetl::optional<std::vector<Object>>(const Object& value)> items;
};

/// Same hooks as a sequence; `build` deduplicates by value equality.
///
struct SetShape final
{
    std::function<Object(std::vector<Object>&& items)>                  build;
    std::function<cetl::optional<std::vector<Object>>(const Object& value)> items;
};

struct TupleShape final
{
    std::function<Object(std::vector<Object>&& items)>                  build;
    std::function<cetl::optional<std::vector<Object>>(const Object& value)> items;
};

struct MappingShape final
{
    using Entries = std::vector<std::pair<std::string, Object>>;

    std::function<Object(Entries&& entries)>                  build;
    std::function<cetl::optional<Entries>(const Object& value)> entries;
};

struct UnionShape final
{
    /// Turns a loaded member value into the union value; `nullopt` if the value fits no member.
    std::function<cetl::optional<Object>(Object&& member_value)> wrap;

    /// Extracts the active member value (empty object for None); `nullopt` if not a union value.
    std::function<cetl::optional<Object>(const Object& value)> unwrap;

    /// Exact runtime type of the active member.
    std::function<cetl::optional<TypeDescriptor>(const Object& value)> runtime_type;
};

struct EnumShape final
{
    struct Enumerant final
    {
        std::string  name;
        std::int64_t value;

        /// The scalar the enumerant is represented with in the data (its underlying value by default).
        Tree data;
    };
    std::vector<Enumerant> enumerants;

    /// Values may be any bitwise combination of the enumerants.
    bool is_flag{false};

    std::function<Object(std::int64_t value)>                      from_value;
    std::function<cetl::optional<std::int64_t>(const Object& value)> to_value;
};

struct ObjectShape final
{
    std::vector<Parameter> parameters;

    /// Builds an instance; may throw (`LoadError`, `MissingArgumentError` or anything else).
    std::function<Object(Arguments& arguments)> construct;
};

struct LiteralShape final
{
    Tree   value;
    Object object;
};

using Shape = cetl::variant<AnyShape,
                            PrimitiveShape,
                            SequenceShape,
                            SetShape,
                            TupleShape,
                            MappingShape,
                            UnionShape,
                            EnumShape,
                            ObjectShape,
                            LiteralShape>;

/// Immutable description of "what to convert".
///
/// A cheap copyable handle. Identity (equality and hash) is the kind, the C++ type
/// and, for literals, the constant value.
///
class TypeDescriptor final
{
public:
    CETL_NODISCARD static TypeDescriptor make(const TypeKind              kind,
                                              std::string                 name,
                                              const std::type_index       type_index,
                                              std::vector<TypeDescriptor> args,
                                              Shape                       shape,
                                              std::string                 discriminator = {});

    /// Descriptor of the dynamic (any) type: the data tree itself.
    ///
    CETL_NODISCARD static TypeDescriptor any();

    /// Descriptors of the canonical primitive types.
    ///
    CETL_NODISCARD static TypeDescriptor primitive(const PrimitiveKind kind);

    CETL_NODISCARD TypeKind kind() const noexcept;

    CETL_NODISCARD const std::string& name() const noexcept;

    CETL_NODISCARD std::type_index typeIndex() const noexcept;

    CETL_NODISCARD const std::vector<TypeDescriptor>& args() const noexcept;

    CETL_NODISCARD const Shape& shape() const noexcept;

    CETL_NODISCARD std::size_t hash() const noexcept;

    bool operator==(const TypeDescriptor& other) const noexcept;

    bool operator!=(const TypeDescriptor& other) const noexcept
    {
        return !(*this == other);
    }

private:
    struct Info;

    explicit TypeDescriptor(std::shared_ptr<const Info> info)
        : info_{std::move(info)}
    {
    }

    std::shared_ptr<const Info> info_;

};  // TypeDescriptor

}  // namespace treeconv

namespace std
{

template <>
struct hash<treeconv::TypeDescriptor>
{
    std::size_t operator()(const treeconv::TypeDescriptor& type) const noexcept
    {
        return type.hash();
    }
};

}  // namespace std

#endif  // TREECONV_TYPE_DESCRIPTOR_HPP_INCLUDED
