//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_CONVERTER_HPP_INCLUDED
#define TREECONV_CONVERTER_HPP_INCLUDED

#include "errors.hpp"
#include "object.hpp"
#include "tree.hpp"
#include "type_descriptor.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>

namespace treeconv
{

class Context;

struct LoadResult
{
    using Success = Object;
    using Failure = ErrorInfo;

    using Var = cetl::variant<Success, Failure>;
};

struct DumpResult
{
    using Success = Tree;
    using Failure = ErrorInfo;

    using Var = cetl::variant<Success, Failure>;
};

/// Bidirectional conversion between a data tree and objects of one type.
///
/// Converters are immutable once constructed; sub-converters are requested
/// through the context passed to each call.
///
class Converter
{
public:
    using Ptr = std::shared_ptr<Converter>;

    Converter(Converter&&)                 = delete;
    Converter(const Converter&)            = delete;
    Converter& operator=(Converter&&)      = delete;
    Converter& operator=(const Converter&) = delete;

    virtual ~Converter() = default;

    /// Converts a data tree into an object.
    ///
    /// @param data The tree to convert; may be null.
    /// @param key The collection key under which the tree sits in its parent (if any).
    /// @param context The context to resolve sub-converters with.
    ///
    CETL_NODISCARD virtual LoadResult::Var load(const Tree& data, const Key& key, Context& context) const = 0;

    /// Converts an object into a data tree.
    ///
    CETL_NODISCARD virtual DumpResult::Var dump(const Object& value, Context& context) const = 0;

protected:
    Converter() = default;

};  // Converter

/// Supplies a value unconditionally from the context, independently of the input data.
///
class Provider
{
public:
    using Ptr = std::shared_ptr<Provider>;

    Provider(Provider&&)                 = delete;
    Provider(const Provider&)            = delete;
    Provider& operator=(Provider&&)      = delete;
    Provider& operator=(const Provider&) = delete;

    virtual ~Provider() = default;

    CETL_NODISCARD virtual Object provide(Context& context) const = 0;

protected:
    Provider() = default;

};  // Provider

/// Builds converters for the types of a particular shape.
///
class ConverterFactory
{
public:
    using Ptr = std::shared_ptr<ConverterFactory>;

    ConverterFactory(ConverterFactory&&)                 = delete;
    ConverterFactory(const ConverterFactory&)            = delete;
    ConverterFactory& operator=(ConverterFactory&&)      = delete;
    ConverterFactory& operator=(const ConverterFactory&) = delete;

    virtual ~ConverterFactory() = default;

    /// Tries to build a converter for the given type.
    ///
    /// @return `nullptr` if the type is not of this factory's shape.
    /// @throws ResolutionError if the type matches, but the converter can't be built.
    ///
    CETL_NODISCARD virtual Converter::Ptr tryCreateConverter(const TypeDescriptor& type, Context& context) const = 0;

protected:
    ConverterFactory() = default;

};  // ConverterFactory

/// Builds providers on demand.
///
class ProviderFactory
{
public:
    using Ptr = std::shared_ptr<ProviderFactory>;

    ProviderFactory(ProviderFactory&&)                 = delete;
    ProviderFactory(const ProviderFactory&)            = delete;
    ProviderFactory& operator=(ProviderFactory&&)      = delete;
    ProviderFactory& operator=(const ProviderFactory&) = delete;

    virtual ~ProviderFactory() = default;

    CETL_NODISCARD virtual bool canProvide(const TypeDescriptor& type) const = 0;

    CETL_NODISCARD virtual Provider::Ptr createProvider(const TypeDescriptor& type, Context& context) const = 0;

protected:
    ProviderFactory() = default;

};  // ProviderFactory

}  // namespace treeconv

#endif  // TREECONV_CONVERTER_HPP_INCLUDED
