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

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <any>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace treeconv
{
namespace
{

class ExactConverter final : public Converter
{
public:
    LoadResult::Var load(const Tree& data, const Key&, Context&) const override
    {
        return Object{YAML::Clone(data)};
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        if (!value.has_value())
        {
            return tree::makeNull();
        }
        if (const auto* const node = std::any_cast<Tree>(&value))
        {
            return YAML::Clone(*node);
        }
        return engine::invalidObjectType("tree", value);
    }

};  // ExactConverter

// MARK: -

class PrimitiveConverter final : public Converter
{
public:
    PrimitiveConverter(const PrimitiveKind kind, std::vector<PrimitiveKind> fallbacks)
        : kind_{kind}
        , fallbacks_{std::move(fallbacks)}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        if (auto loaded = loadAs(kind_, data))
        {
            return std::move(*loaded);
        }
        for (const auto fallback : fallbacks_)
        {
            if (auto loaded = loadAs(fallback, data))
            {
                return std::move(*loaded);
            }
        }
        if ((tree::kindOf(data) == tree::NodeKind::Integer) && acceptsIntegers())
        {
            return ErrorInfo{"Invalid type, integer value is out of the 64-bit range", "invalid_type", key.target(), {}};
        }
        return ErrorInfo::invalidType(expectedName(), tree::kindName(data), key.target());
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        switch (kind_)
        {
        case PrimitiveKind::Bool:
            if (const auto* const flag = std::any_cast<bool>(&value))
            {
                return tree::makeBool(*flag);
            }
            break;
        case PrimitiveKind::Integer:
            if (const auto* const integer = std::any_cast<std::int64_t>(&value))
            {
                return tree::makeInteger(*integer);
            }
            if (const auto* const integer = std::any_cast<int>(&value))
            {
                return tree::makeInteger(*integer);
            }
            break;
        case PrimitiveKind::Float:
            if (const auto* const real = std::any_cast<double>(&value))
            {
                return tree::makeFloat(*real);
            }
            break;
        case PrimitiveKind::String:
            if (const auto* const text = std::any_cast<std::string>(&value))
            {
                return tree::makeString(*text);
            }
            break;
        default:
            break;
        }
        return engine::invalidObjectType(expectedName(), value);
    }

private:
    const char* expectedName() const noexcept
    {
        switch (kind_)
        {
        case PrimitiveKind::Bool:
            return tree::kindName(tree::NodeKind::Bool);
        case PrimitiveKind::Integer:
            return tree::kindName(tree::NodeKind::Integer);
        case PrimitiveKind::Float:
            return tree::kindName(tree::NodeKind::Float);
        default:
            return tree::kindName(tree::NodeKind::String);
        }
    }

    bool acceptsIntegers() const
    {
        return (kind_ == PrimitiveKind::Integer) ||
               (std::find(fallbacks_.begin(), fallbacks_.end(), PrimitiveKind::Integer) != fallbacks_.end());
    }

    /// Loads the tree as a value of the given kind, converting it to the kind of this converter.
    ///
    cetl::optional<Object> loadAs(const PrimitiveKind kind, const Tree& data) const
    {
        switch (kind)
        {
        case PrimitiveKind::Bool:
            if (const auto flag = tree::asBool(data))
            {
                return fromBool(*flag);
            }
            break;
        case PrimitiveKind::Integer:
            if (const auto integer = tree::asInteger(data))
            {
                return fromInteger(*integer);
            }
            break;
        case PrimitiveKind::Float:
            if (const auto real = tree::asFloat(data))
            {
                return fromFloat(*real);
            }
            break;
        case PrimitiveKind::String:
            if (auto text = tree::asString(data))
            {
                if (kind_ == PrimitiveKind::String)
                {
                    return Object{std::move(*text)};
                }
            }
            break;
        default:
            break;
        }
        return cetl::nullopt;
    }

    cetl::optional<Object> fromBool(const bool flag) const
    {
        if (kind_ == PrimitiveKind::Bool)
        {
            return Object{flag};
        }
        return cetl::nullopt;
    }

    cetl::optional<Object> fromInteger(const std::int64_t integer) const
    {
        switch (kind_)
        {
        case PrimitiveKind::Integer:
            return Object{integer};
        case PrimitiveKind::Float:
            return Object{static_cast<double>(integer)};
        default:
            return cetl::nullopt;
        }
    }

    cetl::optional<Object> fromFloat(const double real) const
    {
        switch (kind_)
        {
        case PrimitiveKind::Float:
            return Object{real};
        case PrimitiveKind::Integer:
        {
            // Truncation, within the integer range only.
            constexpr auto limit = 9223372036854775808.0;  // 2^63
            if (!std::isfinite(real) || (real >= limit) || (real < -limit))
            {
                return cetl::nullopt;
            }
            return Object{static_cast<std::int64_t>(std::trunc(real))};
        }
        default:
            return cetl::nullopt;
        }
    }

    const PrimitiveKind              kind_;
    const std::vector<PrimitiveKind> fallbacks_;

};  // PrimitiveConverter

// MARK: -

class NoneConverter final : public Converter
{
public:
    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        if (tree::kindOf(data) != tree::NodeKind::Null)
        {
            return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Null), tree::kindName(data), key.target());
        }
        return Object{};
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        if (value.has_value() && (std::any_cast<std::nullptr_t>(&value) == nullptr))
        {
            return engine::invalidObjectType("None", value);
        }
        return tree::makeNull();
    }

};  // NoneConverter

// MARK: -

class BytesConverter final : public Converter
{
public:
    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        if (const auto text = tree::asString(data))
        {
            return Object{Bytes(text->begin(), text->end())};
        }
        return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::String), tree::kindName(data), key.target());
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        const auto* const bytes = std::any_cast<Bytes>(&value);
        if (bytes == nullptr)
        {
            return engine::invalidObjectType("bytes", value);
        }
        if (const auto bad_position = findInvalidUtf8(*bytes))
        {
            return ErrorInfo{"'utf-8' codec can't decode byte at position " + std::to_string(*bad_position),
                             "invalid_encoding",
                             cetl::nullopt,
                             {}};
        }
        return tree::makeString(std::string(bytes->begin(), bytes->end()));
    }

private:
    /// Strict UTF-8 validation (no overlong forms, surrogates or code points above U+10FFFF).
    ///
    /// @return Position of the first invalid byte, if any.
    ///
    static cetl::optional<std::size_t> findInvalidUtf8(const Bytes& bytes)
    {
        // NOLINTBEGIN(*-magic-numbers)
        std::size_t pos = 0;
        while (pos < bytes.size())
        {
            const std::uint8_t lead = bytes[pos];
            if (lead < 0x80)
            {
                ++pos;
                continue;
            }

            std::size_t   length    = 0;
            std::uint32_t min_value = 0;
            std::uint32_t code      = 0;
            if ((lead & 0xE0U) == 0xC0U)
            {
                length    = 2;
                min_value = 0x80;
                code      = lead & 0x1FU;
            }
            else if ((lead & 0xF0U) == 0xE0U)
            {
                length    = 3;
                min_value = 0x800;
                code      = lead & 0x0FU;
            }
            else if ((lead & 0xF8U) == 0xF0U)
            {
                length    = 4;
                min_value = 0x10000;
                code      = lead & 0x07U;
            }
            else
            {
                return pos;
            }

            if ((pos + length) > bytes.size())
            {
                return pos;
            }
            for (std::size_t i = 1; i < length; ++i)
            {
                const std::uint8_t next = bytes[pos + i];
                if ((next & 0xC0U) != 0x80U)
                {
                    return pos;
                }
                code = (code << 6U) | (next & 0x3FU);
            }
            if ((code < min_value) || (code > 0x10FFFFU) || ((code >= 0xD800U) && (code <= 0xDFFFU)))
            {
                return pos;
            }
            pos += length;
        }
        return cetl::nullopt;
        // NOLINTEND(*-magic-numbers)
    }

};  // BytesConverter

// MARK: -

class TimestampConverter final : public Converter
{
public:
    using Seconds = std::chrono::duration<double>;

    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        cetl::optional<double> seconds;
        if (const auto integer = tree::asInteger(data))
        {
            seconds = static_cast<double>(*integer);
        }
        else
        {
            seconds = tree::asFloat(data);
        }
        if (!seconds)
        {
            return invalidDatetime(key, ErrorInfo::invalidType("number", tree::kindName(data), cetl::nullopt));
        }

        const auto max_seconds = std::chrono::duration_cast<Seconds>(Timestamp::duration::max()).count();
        if (!std::isfinite(*seconds) || (std::abs(*seconds) >= max_seconds))
        {
            return invalidDatetime(key, ErrorInfo::fromException(std::out_of_range{"Timestamp is out of range"}));
        }

        const auto since_epoch = std::chrono::duration_cast<Timestamp::duration>(Seconds{*seconds});
        return Object{Timestamp{since_epoch}};
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        const auto* const timestamp = std::any_cast<Timestamp>(&value);
        if (timestamp == nullptr)
        {
            return engine::invalidObjectType("timestamp", value);
        }
        return tree::makeFloat(std::chrono::duration_cast<Seconds>(timestamp->time_since_epoch()).count());
    }

private:
    static ErrorInfo invalidDatetime(const Key& key, ErrorInfo cause)
    {
        return ErrorInfo::wrap("Invalid datetime", "invalid_datetime", key.target(), std::move(cause));
    }

};  // TimestampConverter

// MARK: -

class AnyConverter final : public Converter
{
public:
    AnyConverter(const AnyLoadPolicy load_policy, const AnyDumpPolicy dump_policy)
        : load_policy_{load_policy}
        , dump_policy_{dump_policy}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        if (load_policy_ == AnyLoadPolicy::RaiseError)
        {
            return ErrorInfo{"Loading Any type is restricted", "any_load_forbidden", key.target(), {}};
        }
        return Object{YAML::Clone(data)};
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        if (dump_policy_ == AnyDumpPolicy::RaiseError)
        {
            return ErrorInfo{"Cannot dump \"Any\" type. Make sure you specified types correctly.",
                             "any_dump_forbidden",
                             cetl::nullopt,
                             {}};
        }
        if (auto node = engine::treeOfScalar(value))
        {
            return std::move(*node);
        }
        return engine::invalidObjectType("tree or scalar", value);
    }

private:
    const AnyLoadPolicy load_policy_;
    const AnyDumpPolicy dump_policy_;

};  // AnyConverter

// MARK: -

class LiteralConverter final : public Converter
{
public:
    LiteralConverter(Tree value, Object object)
        : value_{std::move(value)}
        , object_{std::move(object)}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        if (!tree::equal(data, value_))
        {
            return ErrorInfo{"Invalid literal value: expected " + engine::describe(value_) + ", got " +
                                 engine::describe(data),
                             "invalid_literal",
                             key.target(),
                             {}};
        }
        return object_;
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        const auto node = engine::treeOfScalar(value);
        if (!node || !tree::equal(*node, value_))
        {
            return ErrorInfo{"Invalid literal value: expected " + engine::describe(value_) + ", got " +
                                 (node ? engine::describe(*node) : engine::typeNameOf(value)),
                             "invalid_literal",
                             cetl::nullopt,
                             {}};
        }
        // The constant is shared by every user of the converter; callers get their own copy.
        return YAML::Clone(value_);
    }

private:
    const Tree   value_;
    const Object object_;

};  // LiteralConverter

}  // namespace

Converter::Ptr makeExactConverter()
{
    return std::make_shared<ExactConverter>();
}

Converter::Ptr makePrimitiveConverter(const PrimitiveKind kind, std::vector<PrimitiveKind> fallbacks)
{
    return std::make_shared<PrimitiveConverter>(kind, std::move(fallbacks));
}

Converter::Ptr makeNoneConverter()
{
    return std::make_shared<NoneConverter>();
}

Converter::Ptr makeBytesConverter()
{
    return std::make_shared<BytesConverter>();
}

Converter::Ptr makeTimestampConverter()
{
    return std::make_shared<TimestampConverter>();
}

Converter::Ptr makeAnyConverter(const AnyLoadPolicy load_policy, const AnyDumpPolicy dump_policy)
{
    return std::make_shared<AnyConverter>(load_policy, dump_policy);
}

Converter::Ptr makeLiteralConverter(Tree value, Object object)
{
    return std::make_shared<LiteralConverter>(std::move(value), std::move(object));
}

}  // namespace treeconv
