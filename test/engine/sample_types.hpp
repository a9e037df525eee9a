//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_SAMPLE_TYPES_HPP_INCLUDED
#define TREECONV_SAMPLE_TYPES_HPP_INCLUDED

#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"
#include "treeconv/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sample
{

struct Point
{
    std::int64_t x{0};
    std::int64_t y{0};

    bool operator==(const Point& other) const
    {
        return (x == other.x) && (y == other.y);
    }
};

struct Person
{
    std::string                   name;
    cetl::optional<std::int64_t>  age;
    std::vector<std::string>      tags;
    std::map<std::string, double> scores;
};

/// Singly linked list; recursive through `next`.
///
struct Node
{
    std::int64_t          value{0};
    std::shared_ptr<Node> next;
};

/// Receives the map key it sits under.
///
struct Item
{
    std::string  id;
    std::int64_t count{0};
};

/// Keeps unknown keys.
///
struct Settings
{
    std::string    name;
    treeconv::Tree extra;
};

/// Not default constructible.
///
class Range final
{
public:
    Range(const std::int64_t low, const std::int64_t high)
        : low_{low}
        , high_{high}
    {
        if (low_ > high_)
        {
            throw std::invalid_argument{"Range low bound is above the high one."};
        }
    }

    std::int64_t low() const noexcept
    {
        return low_;
    }

    std::int64_t high() const noexcept
    {
        return high_;
    }

private:
    std::int64_t low_;
    std::int64_t high_;
};

struct Cat
{
    std::string name;
    bool        indoor{true};
};

struct Dog
{
    std::string  name;
    std::int64_t weight{0};
};

enum class Color : std::int64_t
{
    Red   = 1,
    Green = 2,
    Blue  = 3,
};

/// Enumerants with mixed (integer and string) representations.
enum class Grade : std::int64_t
{
    Pass = 1,
    Fail = 2,
};

enum class Permission : std::uint8_t
{
    Read    = 1,
    Write   = 2,
    Execute = 4,
};

}  // namespace sample

namespace treeconv
{

template <>
struct TypeOf<sample::Point>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Point>{"Point"}.param("x", &sample::Point::x).param("y", &sample::Point::y).build();
    }
};

template <>
struct TypeOf<sample::Person>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Person>{"Person"}
            .param("name", &sample::Person::name)
            .alias("full_name")
            .optional("age", &sample::Person::age)
            .optional("tags", &sample::Person::tags)
            .optional("scores", &sample::Person::scores)
            .build();
    }
};

template <>
struct TypeOf<sample::Node>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Node>{"Node"}
            .param("value", &sample::Node::value)
            .optional("next", &sample::Node::next)
            .build();
    }
};

template <>
struct TypeOf<sample::Item>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Item>{"Item"}
            .optional("id", &sample::Item::id)
            .injectKey()
            .param("count", &sample::Item::count)
            .build();
    }
};

template <>
struct TypeOf<sample::Settings>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Settings>{"Settings"}
            .param("name", &sample::Settings::name)
            .optional("extra", &sample::Settings::extra)
            .leftovers()
            .build();
    }
};

template <>
struct TypeOf<sample::Range>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Range>{"Range"}
            .argument("low", [] { return typeOf<std::int64_t>(); })
            .getter([](const sample::Range& range) { return cetl::make_optional(Object{range.low()}); })
            .argument("high", [] { return typeOf<std::int64_t>(); })
            .getter([](const sample::Range& range) { return cetl::make_optional(Object{range.high()}); })
            .construct([](Arguments& arguments) {
                const auto low  = arguments.take<std::int64_t>("low");
                const auto high = arguments.take<std::int64_t>("high");
                return sample::Range{low, high};
            })
            .build();
    }
};

template <>
struct TypeOf<sample::Cat>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Cat>{"Cat"}
            .param("name", &sample::Cat::name)
            .optional("indoor", &sample::Cat::indoor)
            .build();
    }
};

template <>
struct TypeOf<sample::Dog>
{
    static TypeDescriptor make()
    {
        return ObjectTypeBuilder<sample::Dog>{"Dog"}
            .param("name", &sample::Dog::name)
            .param("weight", &sample::Dog::weight)
            .build();
    }
};

template <>
struct TypeOf<sample::Color>
{
    static TypeDescriptor make()
    {
        return EnumTypeBuilder<sample::Color>{"Color"}
            .value("RED", sample::Color::Red)
            .value("GREEN", sample::Color::Green)
            .value("BLUE", sample::Color::Blue)
            .build();
    }
};

template <>
struct TypeOf<sample::Grade>
{
    static TypeDescriptor make()
    {
        return EnumTypeBuilder<sample::Grade>{"Grade"}
            .value("PASS", sample::Grade::Pass)
            .value("FAIL", sample::Grade::Fail, "2")
            .build();
    }
};

template <>
struct TypeOf<sample::Permission>
{
    static TypeDescriptor make()
    {
        return EnumTypeBuilder<sample::Permission>{"Permission"}
            .value("READ", sample::Permission::Read)
            .value("WRITE", sample::Permission::Write)
            .value("EXECUTE", sample::Permission::Execute)
            .flags()
            .build();
    }
};

}  // namespace treeconv

#endif  // TREECONV_SAMPLE_TYPES_HPP_INCLUDED
