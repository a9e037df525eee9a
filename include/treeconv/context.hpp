//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_CONTEXT_HPP_INCLUDED
#define TREECONV_CONTEXT_HPP_INCLUDED

#include "config.hpp"
#include "converter.hpp"
#include "type_descriptor.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace treeconv
{

enum class AnyLoadPolicy : std::uint8_t
{
    RaiseError,
    LoadAsIs,
};

enum class AnyDumpPolicy : std::uint8_t
{
    RaiseError,
    DumpAsIs,
};

/// What to do with an object parameter which has no type information.
///
enum class MissingTypePolicy : std::uint8_t
{
    RaiseError,
    UseAny,
    FromDefault,
};

/// The converter registry.
///
/// Owns the memoized converter cache, the ordered factory chain, the provider registry
/// and the in-flight resolution stack. Not internally synchronized: confine a context to one thread,
/// or resolve everything up front before sharing it for (read only) conversions.
///
class Context
{
public:
    using Ptr = std::shared_ptr<Context>;

    struct Options
    {
        AnyLoadPolicy     any_load_policy{AnyLoadPolicy::LoadAsIs};
        AnyDumpPolicy     any_dump_policy{AnyDumpPolicy::DumpAsIs};
        MissingTypePolicy missing_type_policy{MissingTypePolicy::RaiseError};
        bool              dump_null_values{true};

        /// Maps configuration file settings; unrecognized values are logged and ignored.
        ///
        CETL_NODISCARD static Options from(const Config& config);

    };  // Options

    /// Makes a context with the primitive converters pre-registered
    /// and the default factory chain (Tuple, Sequence, Mapping, Set, Enum, Object, Union, Literal).
    ///
    CETL_NODISCARD static Ptr make();
    CETL_NODISCARD static Ptr make(const Options& options);

    Context(Context&&)                 = delete;
    Context(const Context&)            = delete;
    Context& operator=(Context&&)      = delete;
    Context& operator=(const Context&) = delete;

    virtual ~Context() = default;

    CETL_NODISCARD virtual const Options& options() const noexcept = 0;

    /// Gets (resolving and caching on first request) the converter for the given type.
    ///
    /// A request for a type which is still being resolved (a recursive type) gets a proxy
    /// which binds to the real converter on its first use.
    ///
    /// @throws ResolutionError if no factory claims the type.
    ///
    CETL_NODISCARD virtual Converter::Ptr getConverter(const TypeDescriptor& type) = 0;

    /// Gets the provider for the given type, if any.
    ///
    CETL_NODISCARD virtual Provider::Ptr getProvider(const TypeDescriptor& type) = 0;

    virtual void addConverter(const TypeDescriptor& type, Converter::Ptr converter) = 0;
    virtual void addProvider(const TypeDescriptor& type, Provider::Ptr provider)    = 0;
    virtual void addProviderFactory(ProviderFactory::Ptr factory)                   = 0;

    /// Appends a factory to the chain (lowest precedence).
    ///
    virtual void addFactory(ConverterFactory::Ptr factory) = 0;

    /// Inserts a factory at the given chain position (0 is the highest precedence).
    ///
    virtual void insertFactory(const std::size_t position, ConverterFactory::Ptr factory) = 0;

protected:
    Context() = default;

};  // Context

}  // namespace treeconv

#endif  // TREECONV_CONTEXT_HPP_INCLUDED
