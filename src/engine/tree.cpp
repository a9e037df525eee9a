//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/tree.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <string>

namespace treeconv
{
namespace tree
{
namespace
{

constexpr auto TagStr   = "tag:yaml.org,2002:str";
constexpr auto TagBool  = "tag:yaml.org,2002:bool";
constexpr auto TagInt   = "tag:yaml.org,2002:int";
constexpr auto TagFloat = "tag:yaml.org,2002:float";
constexpr auto TagNull  = "tag:yaml.org,2002:null";

// MARK: YAML 1.2 core schema, plain scalar resolution.
//
// Scanners are linear and non recursive, so arbitrary long scalars are fine.

bool isOneOf(const std::string& text, std::initializer_list<const char*> words)
{
    for (const auto* const word : words)
    {
        if (text == word)
        {
            return true;
        }
    }
    return false;
}

bool isNullText(const std::string& text)
{
    return isOneOf(text, {"", "~", "null", "Null", "NULL"});
}

bool isBoolText(const std::string& text)
{
    return isOneOf(text, {"true", "True", "TRUE", "false", "False", "FALSE"});
}

bool isDecimalDigit(const char ch)
{
    return (ch >= '0') && (ch <= '9');
}

bool isOctalDigit(const char ch)
{
    return (ch >= '0') && (ch <= '7');
}

bool isHexDigit(const char ch)
{
    return isDecimalDigit(ch) || ((ch >= 'a') && (ch <= 'f')) || ((ch >= 'A') && (ch <= 'F'));
}

/// Scans one or more digits starting at `pos`, and returns the position after them.
///
template <typename Predicate>
std::size_t scanDigits(const std::string& text, std::size_t pos, Predicate&& is_digit)
{
    while ((pos < text.size()) && is_digit(text[pos]))
    {
        ++pos;
    }
    return pos;
}

std::size_t skipSign(const std::string& text)
{
    return (!text.empty() && ((text[0] == '-') || (text[0] == '+'))) ? 1 : 0;
}

/// Radix of an integer scalar (`[-+]?[0-9]+`, `0o[0-7]+` or `0x[0-9a-fA-F]+`), or zero if it is not one.
///
int integerRadix(const std::string& text)
{
    if ((text.size() > 2) && (text[0] == '0') && (text[1] == 'x'))
    {
        return (scanDigits(text, 2, isHexDigit) == text.size()) ? 16 : 0;  // NOLINT(*-magic-numbers)
    }
    if ((text.size() > 2) && (text[0] == '0') && (text[1] == 'o'))
    {
        return (scanDigits(text, 2, isOctalDigit) == text.size()) ? 8 : 0;  // NOLINT(*-magic-numbers)
    }
    const auto begin = skipSign(text);
    const auto end   = scanDigits(text, begin, isDecimalDigit);
    return ((end > begin) && (end == text.size())) ? 10 : 0;  // NOLINT(*-magic-numbers)
}

bool isInfinityText(const std::string& text)
{
    const auto sign = skipSign(text);
    return isOneOf(text.substr(sign), {".inf", ".Inf", ".INF"});
}

bool isNanText(const std::string& text)
{
    return isOneOf(text, {".nan", ".NaN", ".NAN"});
}

/// `[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?`
///
bool isFiniteFloatText(const std::string& text)
{
    auto pos = skipSign(text);

    const auto int_end = scanDigits(text, pos, isDecimalDigit);
    const bool has_int = int_end > pos;
    pos                = int_end;
    if ((pos < text.size()) && (text[pos] == '.'))
    {
        const auto frac_end = scanDigits(text, pos + 1, isDecimalDigit);
        if (!has_int && (frac_end == pos + 1))
        {
            return false;
        }
        pos = frac_end;
    }
    else if (!has_int)
    {
        return false;
    }

    if ((pos < text.size()) && ((text[pos] == 'e') || (text[pos] == 'E')))
    {
        ++pos;
        if ((pos < text.size()) && ((text[pos] == '-') || (text[pos] == '+')))
        {
            ++pos;
        }
        const auto exp_end = scanDigits(text, pos, isDecimalDigit);
        if (exp_end == pos)
        {
            return false;
        }
        pos = exp_end;
    }
    return pos == text.size();
}

bool isFloatText(const std::string& text)
{
    return isFiniteFloatText(text) || isInfinityText(text) || isNanText(text);
}

/// Value of an integer scalar; empty when it is out of the `int64` range.
///
cetl::optional<std::int64_t> parseInteger(const std::string& text)
{
    const auto radix = integerRadix(text);
    if (radix == 0)
    {
        return cetl::nullopt;
    }

    const auto digits = (radix == 10) ? text : text.substr(2);  // NOLINT(*-magic-numbers)
    char*      end    = nullptr;
    errno             = 0;
    const auto value  = std::strtoll(digits.c_str(), &end, radix);
    if ((errno == ERANGE) || (end != digits.c_str() + digits.size()))
    {
        return cetl::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

/// Value of a float (or integer) scalar. Out of range magnitudes saturate to infinity or zero.
///
cetl::optional<double> parseFloat(const std::string& text)
{
    if (isNanText(text))
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (isInfinityText(text))
    {
        const auto inf = std::numeric_limits<double>::infinity();
        return (text[0] == '-') ? -inf : inf;
    }
    if (!isFiniteFloatText(text) && (integerRadix(text) != 10))  // NOLINT(*-magic-numbers)
    {
        return cetl::nullopt;
    }
    return std::strtod(text.c_str(), nullptr);
}

NodeKind resolvePlain(const std::string& text)
{
    if (isNullText(text))
    {
        return NodeKind::Null;
    }
    if (isBoolText(text))
    {
        return NodeKind::Bool;
    }
    if (integerRadix(text) != 0)
    {
        // Even when out of the `int64` range.
        return NodeKind::Integer;
    }
    if (isFloatText(text))
    {
        return NodeKind::Float;
    }
    return NodeKind::String;
}

NodeKind resolveScalar(const Tree& node)
{
    const auto& tag  = node.Tag();
    const auto& text = node.Scalar();

    if (tag.empty() || (tag == "?"))
    {
        return resolvePlain(text);
    }
    if (tag == TagBool)
    {
        return NodeKind::Bool;
    }
    if (tag == TagInt)
    {
        return NodeKind::Integer;
    }
    if (tag == TagFloat)
    {
        return NodeKind::Float;
    }
    if (tag == TagNull)
    {
        return NodeKind::Null;
    }
    // `!` (quoted), `!!str` and any application specific tag.
    return NodeKind::String;
}

bool equalScalars(const NodeKind kind, const Tree& lhs, const Tree& rhs)
{
    switch (kind)
    {
    case NodeKind::Null:
        return true;
    case NodeKind::Bool:
        return asBool(lhs) == asBool(rhs);
    case NodeKind::Integer:
    {
        const auto lhs_value = asInteger(lhs);
        const auto rhs_value = asInteger(rhs);
        if (lhs_value && rhs_value)
        {
            return lhs_value.value() == rhs_value.value();
        }
        return lhs.Scalar() == rhs.Scalar();
    }
    case NodeKind::Float:
        return asFloat(lhs) == asFloat(rhs);
    default:
        return lhs.Scalar() == rhs.Scalar();
    }
}

bool isNumber(const NodeKind kind)
{
    return (kind == NodeKind::Integer) || (kind == NodeKind::Float);
}

double toDouble(const NodeKind kind, const Tree& node)
{
    if (kind == NodeKind::Integer)
    {
        if (const auto integer = asInteger(node))
        {
            return static_cast<double>(integer.value());
        }
    }
    return parseFloat(node.Scalar()).value_or(std::numeric_limits<double>::quiet_NaN());
}

}  // namespace

NodeKind kindOf(const Tree& node)
{
    if (!node.IsDefined() || node.IsNull())
    {
        return NodeKind::Null;
    }
    if (node.IsSequence())
    {
        return NodeKind::Sequence;
    }
    if (node.IsMap())
    {
        return NodeKind::Map;
    }
    return resolveScalar(node);
}

const char* kindName(const NodeKind kind) noexcept
{
    switch (kind)
    {
    case NodeKind::Null:
        return "null";
    case NodeKind::Bool:
        return "bool";
    case NodeKind::Integer:
        return "integer";
    case NodeKind::Float:
        return "float";
    case NodeKind::String:
        return "string";
    case NodeKind::Sequence:
        return "sequence";
    case NodeKind::Map:
        return "map";
    }
    return "unknown";
}

Tree makeNull()
{
    return Tree{YAML::NodeType::Null};
}

Tree makeBool(const bool value)
{
    return Tree{std::string{value ? "true" : "false"}};
}

Tree makeInteger(const std::int64_t value)
{
    return Tree{std::to_string(value)};
}

Tree makeFloat(const double value)
{
    if (std::isnan(value))
    {
        return Tree{std::string{".nan"}};
    }
    if (std::isinf(value))
    {
        return Tree{std::string{(value < 0) ? "-.inf" : ".inf"}};
    }

    // Shortest round-trip representation, but always recognizable as a float.
    auto text = fmt::format("{}", value);
    if (integerRadix(text) != 0)
    {
        text += ".0";
    }
    return Tree{text};
}

Tree makeString(const std::string& value)
{
    Tree node{value};
    if (resolvePlain(value) != NodeKind::String)
    {
        node.SetTag(TagStr);
    }
    return node;
}

Tree makeSequence()
{
    return Tree{YAML::NodeType::Sequence};
}

Tree makeMap()
{
    return Tree{YAML::NodeType::Map};
}

cetl::optional<bool> asBool(const Tree& node)
{
    if (kindOf(node) != NodeKind::Bool)
    {
        return cetl::nullopt;
    }
    const auto& text = node.Scalar();
    return (text == "true") || (text == "True") || (text == "TRUE");
}

cetl::optional<std::int64_t> asInteger(const Tree& node)
{
    if (kindOf(node) != NodeKind::Integer)
    {
        return cetl::nullopt;
    }
    return parseInteger(node.Scalar());
}

cetl::optional<double> asFloat(const Tree& node)
{
    if (kindOf(node) != NodeKind::Float)
    {
        return cetl::nullopt;
    }
    return parseFloat(node.Scalar());
}

cetl::optional<std::string> asString(const Tree& node)
{
    if (kindOf(node) != NodeKind::String)
    {
        return cetl::nullopt;
    }
    return node.Scalar();
}

bool equal(const Tree& lhs, const Tree& rhs)
{
    const auto lhs_kind = kindOf(lhs);
    const auto rhs_kind = kindOf(rhs);
    if (lhs_kind != rhs_kind)
    {
        if (isNumber(lhs_kind) && isNumber(rhs_kind))
        {
            return toDouble(lhs_kind, lhs) == toDouble(rhs_kind, rhs);
        }
        return false;
    }

    switch (lhs_kind)
    {
    case NodeKind::Sequence:
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            if (!equal(lhs[i], rhs[i]))
            {
                return false;
            }
        }
        return true;
    }
    case NodeKind::Map:
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (const auto& lhs_entry : lhs)
        {
            const auto& key   = lhs_entry.first.Scalar();
            bool        found = false;
            for (const auto& rhs_entry : rhs)
            {
                if (rhs_entry.first.Scalar() == key)
                {
                    if (!equal(lhs_entry.second, rhs_entry.second))
                    {
                        return false;
                    }
                    found = true;
                    break;
                }
            }
            if (!found)
            {
                return false;
            }
        }
        return true;
    }
    default:
        return equalScalars(lhs_kind, lhs, rhs);
    }
}

}  // namespace tree
}  // namespace treeconv
