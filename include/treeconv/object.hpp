//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_OBJECT_HPP_INCLUDED
#define TREECONV_OBJECT_HPP_INCLUDED

#include "errors.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treeconv
{

/// Type erased in-memory value; an empty object stands for null (None).
///
using Object = std::any;

using Bytes     = std::vector<std::uint8_t>;
using Timestamp = std::chrono::system_clock::time_point;

/// Optional collection key of a loaded value.
///
/// It's the attribute name, map key, sequence index or tuple position under which
/// the value sits in its parent; absent for the root value.
///
class Key final
{
public:
    Key() = default;

    // NOLINTNEXTLINE(*-explicit-constructor, *-explicit-conversions)
    Key(std::string name)
        : value_{std::move(name)}
    {
    }

    // NOLINTNEXTLINE(*-explicit-constructor, *-explicit-conversions)
    Key(const char* const name)
        : value_{std::string{name}}
    {
    }

    CETL_NODISCARD static Key index(const std::size_t index)
    {
        Key key;
        key.value_ = static_cast<std::int64_t>(index);
        return key;
    }

    CETL_NODISCARD bool isPresent() const noexcept
    {
        return cetl::get_if<cetl::monostate>(&value_) == nullptr;
    }

    /// Renders the key as a target segment of an error path.
    ///
    CETL_NODISCARD cetl::optional<std::string> target() const
    {
        if (const auto* const name = cetl::get_if<std::string>(&value_))
        {
            return *name;
        }
        if (const auto* const index = cetl::get_if<std::int64_t>(&value_))
        {
            return std::to_string(*index);
        }
        return cetl::nullopt;
    }

    /// Gets the key as an injectable value: `std::string` or `std::int64_t` (empty if absent).
    ///
    CETL_NODISCARD Object toObject() const
    {
        if (const auto* const name = cetl::get_if<std::string>(&value_))
        {
            return Object{*name};
        }
        if (const auto* const index = cetl::get_if<std::int64_t>(&value_))
        {
            return Object{*index};
        }
        return Object{};
    }

private:
    cetl::variant<cetl::monostate, std::string, std::int64_t> value_;

};  // Key

/// Keyword arguments of an object construct callable.
///
/// Arguments which couldn't be resolved from the data (nor provided, nor injected)
/// are simply absent, so that the callable applies its own defaults,
/// or fails with `MissingArgumentError` for the required ones.
///
class Arguments final
{
public:
    void set(const std::string& name, Object value)
    {
        values_[name] = std::move(value);
    }

    CETL_NODISCARD bool contains(const std::string& name) const
    {
        return values_.find(name) != values_.end();
    }

    CETL_NODISCARD std::size_t size() const noexcept
    {
        return values_.size();
    }

    /// Extracts a required argument.
    ///
    /// @throws MissingArgumentError if the argument is absent.
    /// @throws std::bad_any_cast if the argument holds another type.
    ///
    template <typename T>
    T take(const std::string& name)
    {
        auto it = values_.find(name);
        if (it == values_.end())
        {
            throw MissingArgumentError{name};
        }
        T value = std::any_cast<T>(std::move(it->second));
        values_.erase(it);
        return value;
    }

    /// Extracts an argument, falling back to the given default when absent.
    ///
    template <typename T>
    T takeOr(const std::string& name, T default_value)
    {
        if (!contains(name))
        {
            return default_value;
        }
        return take<T>(name);
    }

    /// Extracts an argument as is (type erased).
    ///
    CETL_NODISCARD cetl::optional<Object> takeObject(const std::string& name)
    {
        auto it = values_.find(name);
        if (it == values_.end())
        {
            return cetl::nullopt;
        }
        Object value = std::move(it->second);
        values_.erase(it);
        return value;
    }

private:
    std::unordered_map<std::string, Object> values_;

};  // Arguments

}  // namespace treeconv

#endif  // TREECONV_OBJECT_HPP_INCLUDED
