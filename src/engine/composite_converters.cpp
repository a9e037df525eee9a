//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/converters.hpp"

#include "engine_helpers.hpp"
#include "logging.hpp"
#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace treeconv
{
namespace
{

/// Element-wise conversion of sequences and sets.
///
template <typename ShapeT>
class ItemsConverter final : public Converter
{
public:
    ItemsConverter(const TypeDescriptor& type, Converter::Ptr item_converter)
        : type_name_{type.name()}
        , shape_{engine::shapeOf<ShapeT>(type)}
        , item_converter_{std::move(item_converter)}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        const auto kind = tree::kindOf(data);
        if (kind == tree::NodeKind::Null)
        {
            return ErrorInfo{"Expected list, got None", "none_load", key.target(), {}};
        }
        if (kind != tree::NodeKind::Sequence)
        {
            return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Sequence), tree::kindName(kind), key.target());
        }

        std::vector<Object> items;
        items.reserve(data.size());
        for (std::size_t index = 0; index < data.size(); ++index)
        {
            auto result = item_converter_->load(data[index], Key::index(index), context);
            if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
            {
                return ErrorInfo::wrap("Failed to load list",
                                       "list_load_error",
                                       key.target(),
                                       ErrorInfo::wrap("Failed to load list element at index " + std::to_string(index),
                                                       "list_element_load_error",
                                                       std::to_string(index),
                                                       std::move(*err)));
            }
            items.push_back(std::move(cetl::get<LoadResult::Success>(result)));
        }

        try
        {
            return shape_.build(std::move(items));

        } catch (const std::exception& ex)
        {
            return ErrorInfo::wrap("Failed to load list", "list_load_error", key.target(), ErrorInfo::fromException(ex));
        }
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        const auto items = shape_.items(value);
        if (!items)
        {
            return engine::invalidObjectType(type_name_, value);
        }

        auto node = tree::makeSequence();
        for (std::size_t index = 0; index < items->size(); ++index)
        {
            auto result = item_converter_->dump((*items)[index], context);
            if (auto* const err = cetl::get_if<DumpResult::Failure>(&result))
            {
                return ErrorInfo::wrap("Failed to dump list",
                                       "list_dump_error",
                                       cetl::nullopt,
                                       ErrorInfo::wrap("Failed to dump list element at index " + std::to_string(index),
                                                       "list_element_dump_error",
                                                       std::to_string(index),
                                                       std::move(*err)));
            }
            node.push_back(cetl::get<DumpResult::Success>(result));
        }
        return node;
    }

private:
    const std::string    type_name_;
    const ShapeT         shape_;
    const Converter::Ptr item_converter_;

};  // ItemsConverter

// MARK: -

class MappingConverter final : public Converter
{
public:
    MappingConverter(const TypeDescriptor& type, Converter::Ptr value_converter)
        : type_name_{type.name()}
        , shape_{engine::shapeOf<MappingShape>(type)}
        , value_converter_{std::move(value_converter)}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        const auto kind = tree::kindOf(data);
        if (kind == tree::NodeKind::Null)
        {
            return ErrorInfo{"Expected dict, got None", "none_load", key.target(), {}};
        }
        if (kind != tree::NodeKind::Map)
        {
            return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Map), tree::kindName(kind), key.target());
        }

        MappingShape::Entries entries;
        entries.reserve(data.size());
        for (const auto& entry : data)
        {
            const auto map_key = entry.first.Scalar();

            auto result = value_converter_->load(entry.second, Key{map_key}, context);
            if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
            {
                return ErrorInfo::wrap("Failed to load dict",
                                       "dict_load_error",
                                       key.target(),
                                       ErrorInfo::wrap("Failed to load dict value",
                                                       "dict_value_load_error",
                                                       map_key,
                                                       std::move(*err)));
            }
            entries.emplace_back(map_key, std::move(cetl::get<LoadResult::Success>(result)));
        }

        try
        {
            return shape_.build(std::move(entries));

        } catch (const std::exception& ex)
        {
            return ErrorInfo::wrap("Failed to load dict", "dict_load_error", key.target(), ErrorInfo::fromException(ex));
        }
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        const auto entries = shape_.entries(value);
        if (!entries)
        {
            return engine::invalidObjectType(type_name_, value);
        }

        auto node = tree::makeMap();
        for (const auto& entry : *entries)
        {
            auto result = value_converter_->dump(entry.second, context);
            if (auto* const err = cetl::get_if<DumpResult::Failure>(&result))
            {
                return ErrorInfo::wrap("Failed to dump dict",
                                       "dict_dump_error",
                                       cetl::nullopt,
                                       ErrorInfo::wrap("Failed to dump dict value",
                                                       "dict_value_dump_error",
                                                       entry.first,
                                                       std::move(*err)));
            }
            node[entry.first] = cetl::get<DumpResult::Success>(result);
        }
        return node;
    }

private:
    const std::string    type_name_;
    const MappingShape   shape_;
    const Converter::Ptr value_converter_;

};  // MappingConverter

// MARK: -

class TupleConverter final : public Converter
{
public:
    TupleConverter(const TypeDescriptor& type, std::vector<Converter::Ptr> converters)
        : type_name_{type.name()}
        , shape_{engine::shapeOf<TupleShape>(type)}
        , converters_{std::move(converters)}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        const auto kind = tree::kindOf(data);
        if (kind == tree::NodeKind::Null)
        {
            return ErrorInfo{"Expected tuple, got None", "none_load", key.target(), {}};
        }
        if (kind != tree::NodeKind::Sequence)
        {
            return ErrorInfo::invalidType(tree::kindName(tree::NodeKind::Sequence), tree::kindName(kind), key.target());
        }
        if (data.size() != converters_.size())
        {
            return invalidLength(data.size(), key.target());
        }

        std::vector<Object> items;
        items.reserve(converters_.size());
        for (std::size_t position = 0; position < converters_.size(); ++position)
        {
            auto result = converters_[position]->load(data[position], Key::index(position), context);
            if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
            {
                return ErrorInfo::wrap("Failed to load tuple",
                                       "tuple_load_error",
                                       key.target(),
                                       ErrorInfo::wrap("Failed to load tuple element at position " +
                                                           std::to_string(position),
                                                       "tuple_element_load_error",
                                                       std::to_string(position),
                                                       std::move(*err)));
            }
            items.push_back(std::move(cetl::get<LoadResult::Success>(result)));
        }

        try
        {
            return shape_.build(std::move(items));

        } catch (const std::exception& ex)
        {
            return ErrorInfo::wrap("Failed to load tuple",
                                   "tuple_load_error",
                                   key.target(),
                                   ErrorInfo::fromException(ex));
        }
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        const auto items = shape_.items(value);
        if (!items)
        {
            return engine::invalidObjectType(type_name_, value);
        }
        if (items->size() != converters_.size())
        {
            return invalidLength(items->size(), cetl::nullopt);
        }

        auto node = tree::makeSequence();
        for (std::size_t position = 0; position < converters_.size(); ++position)
        {
            auto result = converters_[position]->dump((*items)[position], context);
            if (auto* const err = cetl::get_if<DumpResult::Failure>(&result))
            {
                return ErrorInfo::wrap("Failed to dump tuple element at position " + std::to_string(position),
                                       "tuple_dump_error",
                                       std::to_string(position),
                                       std::move(*err));
            }
            node.push_back(cetl::get<DumpResult::Success>(result));
        }
        return node;
    }

private:
    ErrorInfo invalidLength(const std::size_t actual, cetl::optional<std::string> target) const
    {
        return ErrorInfo{"Expected " + std::to_string(converters_.size()) + " values in tuple, got " +
                             std::to_string(actual),
                         "invalid_tuple_len",
                         std::move(target),
                         {}};
    }

    const std::string                 type_name_;
    const TupleShape                  shape_;
    const std::vector<Converter::Ptr> converters_;

};  // TupleConverter

// MARK: -

class UnionConverter final : public Converter
{
public:
    UnionConverter(const TypeDescriptor& type, std::vector<Converter::Ptr> converters)
        : type_name_{type.name()}
        , shape_{engine::shapeOf<UnionShape>(type)}
        , converters_{std::move(converters)}
        , logger_{common::getLogger("treeconv")}
    {
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context& context) const override
    {
        std::vector<ErrorInfo> errors;
        for (const auto& converter : converters_)
        {
            auto result = converter->load(data, key, context);
            if (auto* const err = cetl::get_if<LoadResult::Failure>(&result))
            {
                errors.push_back(std::move(*err));
                continue;
            }
            if (!shape_.wrap)
            {
                return result;
            }
            if (wrap(result, key, errors))
            {
                return result;
            }
        }
        return loadError(key, std::move(errors));
    }

    DumpResult::Var dump(const Object& value, Context& context) const override
    {
        Object                         member_value = value;
        cetl::optional<TypeDescriptor> runtime_type;
        if (shape_.unwrap)
        {
            if (auto unwrapped = shape_.unwrap(value))
            {
                member_value = std::move(*unwrapped);
                if (shape_.runtime_type)
                {
                    runtime_type = shape_.runtime_type(value);
                }
            }
        }

        std::vector<ErrorInfo> errors;

        // Fast path: the converter of the exact runtime type.
        const auto exact_converter = runtime_type ? resolve(*runtime_type, context) : nullptr;
        if (exact_converter)
        {
            auto result = exact_converter->dump(member_value, context);
            if (cetl::get_if<DumpResult::Success>(&result) != nullptr)
            {
                return result;
            }
            errors.push_back(std::move(cetl::get<DumpResult::Failure>(result)));
        }

        for (const auto& converter : converters_)
        {
            if (converter == exact_converter)
            {
                continue;
            }
            auto result = converter->dump(member_value, context);
            if (cetl::get_if<DumpResult::Success>(&result) != nullptr)
            {
                return result;
            }
            errors.push_back(std::move(cetl::get<DumpResult::Failure>(result)));
        }
        return dumpError(std::move(errors));
    }

private:
    /// Replaces a loaded member value with the union value; on failure the error is collected instead.
    ///
    bool wrap(LoadResult::Var& result, const Key& key, std::vector<ErrorInfo>& errors) const
    {
        auto&      member_value     = cetl::get<LoadResult::Success>(result);
        const auto member_type_name = engine::typeNameOf(member_value);
        if (auto value = shape_.wrap(std::move(member_value)))
        {
            result = std::move(*value);
            return true;
        }
        errors.push_back(ErrorInfo::invalidType(type_name_, member_type_name, key.target()));
        return false;
    }

    Converter::Ptr resolve(const TypeDescriptor& runtime_type, Context& context) const
    {
        try
        {
            return context.getConverter(runtime_type);

        } catch (const ResolutionError& ex)
        {
            logger_->debug("Union '{}' runtime type '{}' is unresolved ({}).",
                           type_name_,
                           runtime_type.name(),
                           ex.what());
        }
        return nullptr;
    }

    static LoadResult::Var loadError(const Key& key, std::vector<ErrorInfo> errors)
    {
        return ErrorInfo{"Unable to load union type: no suitable converter found",
                         "union_load_error",
                         key.target(),
                         std::move(errors)};
    }

    static DumpResult::Var dumpError(std::vector<ErrorInfo> errors)
    {
        return ErrorInfo{"Unable to dump union type: no suitable converter found",
                         "union_dump_error",
                         cetl::nullopt,
                         std::move(errors)};
    }

    const std::string                 type_name_;
    const UnionShape                  shape_;
    const std::vector<Converter::Ptr> converters_;
    common::LoggerPtr                 logger_;

};  // UnionConverter

// MARK: -

class EnumConverter final : public Converter
{
public:
    explicit EnumConverter(const TypeDescriptor& type)
        : type_name_{type.name()}
        , shape_{engine::shapeOf<EnumShape>(type)}
    {
        for (const auto& enumerant : shape_.enumerants)
        {
            all_bits_ |= static_cast<std::uint64_t>(enumerant.value);
        }
    }

    LoadResult::Var load(const Tree& data, const Key& key, Context&) const override
    {
        for (const auto& enumerant : shape_.enumerants)
        {
            if (tree::equal(data, enumerant.data))
            {
                return shape_.from_value(enumerant.value);
            }
        }
        if (shape_.is_flag)
        {
            const auto value = tree::asInteger(data);
            if (value && isCombination(*value))
            {
                return shape_.from_value(*value);
            }
        }
        return ErrorInfo::wrap("Failed to load enum " + type_name_,
                               "enum_load_error",
                               key.target(),
                               invalidValue(engine::describe(data)));
    }

    DumpResult::Var dump(const Object& value, Context&) const override
    {
        const auto underlying = shape_.to_value(value);
        if (!underlying)
        {
            return engine::invalidObjectType(type_name_, value);
        }
        for (const auto& enumerant : shape_.enumerants)
        {
            if (enumerant.value == *underlying)
            {
                return YAML::Clone(enumerant.data);
            }
        }
        if (shape_.is_flag && isCombination(*underlying))
        {
            return tree::makeInteger(*underlying);
        }
        return invalidValue(std::to_string(*underlying));
    }

private:
    bool isCombination(const std::int64_t value) const
    {
        return (static_cast<std::uint64_t>(value) & ~all_bits_) == 0U;
    }

    ErrorInfo invalidValue(const std::string& value) const
    {
        return ErrorInfo{value + " is not a valid " + type_name_, "invalid_enum_value", cetl::nullopt, {}};
    }

    const std::string type_name_;
    const EnumShape   shape_;
    std::uint64_t     all_bits_{0};

};  // EnumConverter

}  // namespace

Converter::Ptr makeSequenceConverter(const TypeDescriptor& type, Converter::Ptr item_converter)
{
    return std::make_shared<ItemsConverter<SequenceShape>>(type, std::move(item_converter));
}

Converter::Ptr makeSetConverter(const TypeDescriptor& type, Converter::Ptr item_converter)
{
    return std::make_shared<ItemsConverter<SetShape>>(type, std::move(item_converter));
}

Converter::Ptr makeMappingConverter(const TypeDescriptor& type, Converter::Ptr value_converter)
{
    return std::make_shared<MappingConverter>(type, std::move(value_converter));
}

Converter::Ptr makeTupleConverter(const TypeDescriptor& type, std::vector<Converter::Ptr> converters)
{
    return std::make_shared<TupleConverter>(type, std::move(converters));
}

Converter::Ptr makeUnionConverter(const TypeDescriptor& type, std::vector<Converter::Ptr> converters)
{
    return std::make_shared<UnionConverter>(type, std::move(converters));
}

Converter::Ptr makeEnumConverter(const TypeDescriptor& type)
{
    return std::make_shared<EnumConverter>(type);
}

}  // namespace treeconv
