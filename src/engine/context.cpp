//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/context.hpp"

#include "logging.hpp"
#include "proxy_converter.hpp"
#include "treeconv/config.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/converters.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/factories.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace treeconv
{
namespace
{

class ContextImpl final : public Context
{
public:
    explicit ContextImpl(const Options& options)
        : options_{options}
        , logger_{common::getLogger("treeconv")}
        , any_converter_{makeAnyConverter(options.any_load_policy, options.any_dump_policy)}
        , factories_{makeDefaultFactories(options)}
    {
        addConverter(TypeDescriptor::primitive(PrimitiveKind::None), makeNoneConverter());
        addConverter(TypeDescriptor::primitive(PrimitiveKind::Bool), makePrimitiveConverter(PrimitiveKind::Bool));
        addConverter(TypeDescriptor::primitive(PrimitiveKind::Integer),
                     makePrimitiveConverter(PrimitiveKind::Integer, {PrimitiveKind::Float}));
        addConverter(TypeDescriptor::primitive(PrimitiveKind::Float),
                     makePrimitiveConverter(PrimitiveKind::Float, {PrimitiveKind::Integer}));
        addConverter(TypeDescriptor::primitive(PrimitiveKind::String), makePrimitiveConverter(PrimitiveKind::String));
        addConverter(TypeDescriptor::primitive(PrimitiveKind::Bytes), makeBytesConverter());
        addConverter(TypeDescriptor::primitive(PrimitiveKind::Timestamp), makeTimestampConverter());
    }

    // Context

    const Options& options() const noexcept override
    {
        return options_;
    }

    Converter::Ptr getConverter(const TypeDescriptor& type) override
    {
        if (type.kind() == TypeKind::Any)
        {
            return any_converter_;
        }

        const auto cached = converters_.find(type);
        if (cached != converters_.end())
        {
            return cached->second;
        }

        if (in_flight_.find(type) != in_flight_.end())
        {
            logger_->trace("Type '{}' is being resolved; making proxy.", type.name());
            return engine::makeProxyConverter(type);
        }

        const InFlightGuard in_flight_guard{in_flight_, type};

        // The chain may be modified by a factory (through the context), so walk a snapshot of it.
        const auto factories = factories_;
        for (const auto& factory : factories)
        {
            if (auto converter = factory->tryCreateConverter(type, *this))
            {
                logger_->debug("Resolved converter for type '{}'.", type.name());
                converters_[type] = converter;
                return converter;
            }
        }

        logger_->warn("No converter found for type '{}'.", type.name());
        throw ResolutionError{"No converter found for type '" + type.name() + "'"};
    }

    Provider::Ptr getProvider(const TypeDescriptor& type) override
    {
        const auto registered = providers_.find(type);
        if (registered != providers_.end())
        {
            return registered->second;
        }

        for (const auto& factory : provider_factories_)
        {
            if (factory->canProvide(type))
            {
                auto provider = factory->createProvider(type, *this);
                logger_->debug("Provider factory created provider for type '{}'.", type.name());
                providers_[type] = provider;
                return provider;
            }
        }
        return nullptr;
    }

    void addConverter(const TypeDescriptor& type, Converter::Ptr converter) override
    {
        converters_[type] = std::move(converter);
    }

    void addProvider(const TypeDescriptor& type, Provider::Ptr provider) override
    {
        providers_[type] = std::move(provider);
    }

    void addProviderFactory(ProviderFactory::Ptr factory) override
    {
        provider_factories_.push_back(std::move(factory));
    }

    void addFactory(ConverterFactory::Ptr factory) override
    {
        factories_.push_back(std::move(factory));
    }

    void insertFactory(const std::size_t position, ConverterFactory::Ptr factory) override
    {
        const auto offset = static_cast<std::ptrdiff_t>(std::min(position, factories_.size()));
        factories_.insert(std::next(factories_.begin(), offset), std::move(factory));
    }

private:
    using TypeSet = std::unordered_set<TypeDescriptor>;

    /// Keeps a type on the resolution stack for the duration of its factory chain walk
    /// (popped on both success and failure).
    ///
    class InFlightGuard final
    {
    public:
        InFlightGuard(TypeSet& in_flight, const TypeDescriptor& type)
            : in_flight_{in_flight}
            , type_{type}
        {
            in_flight_.insert(type_);
        }

        InFlightGuard(InFlightGuard&&)                 = delete;
        InFlightGuard(const InFlightGuard&)            = delete;
        InFlightGuard& operator=(InFlightGuard&&)      = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

        ~InFlightGuard()
        {
            in_flight_.erase(type_);
        }

    private:
        TypeSet&             in_flight_;
        const TypeDescriptor type_;

    };  // InFlightGuard

    const Options                                      options_;
    common::LoggerPtr                                  logger_;
    const Converter::Ptr                               any_converter_;
    std::vector<ConverterFactory::Ptr>                 factories_;
    std::vector<ProviderFactory::Ptr>                  provider_factories_;
    std::unordered_map<TypeDescriptor, Converter::Ptr> converters_;
    std::unordered_map<TypeDescriptor, Provider::Ptr>  providers_;
    TypeSet                                            in_flight_;

};  // ContextImpl

template <typename Policy>
cetl::optional<Policy> parsePolicy(const std::string&                                 name,
                                   const std::vector<std::pair<const char*, Policy>>& known,
                                   const char* const                                  setting,
                                   const common::LoggerPtr&                           logger)
{
    for (const auto& entry : known)
    {
        if (name == entry.first)
        {
            return entry.second;
        }
    }
    logger->warn("Ignoring unknown '{}' value '{}'.", setting, name);
    return cetl::nullopt;
}

}  // namespace

Context::Options Context::Options::from(const Config& config)
{
    const auto logger = common::getLogger("treeconv");

    Options options;
    if (const auto name = config.getAnyLoadPolicy())
    {
        const auto policy = parsePolicy<AnyLoadPolicy>(*name,
                                                       {{"raise_error", AnyLoadPolicy::RaiseError},
                                                        {"load_as_is", AnyLoadPolicy::LoadAsIs}},
                                                       "any_load_policy",
                                                       logger);
        options.any_load_policy = policy.value_or(options.any_load_policy);
    }
    if (const auto name = config.getAnyDumpPolicy())
    {
        const auto policy = parsePolicy<AnyDumpPolicy>(*name,
                                                       {{"raise_error", AnyDumpPolicy::RaiseError},
                                                        {"dump_as_is", AnyDumpPolicy::DumpAsIs}},
                                                       "any_dump_policy",
                                                       logger);
        options.any_dump_policy = policy.value_or(options.any_dump_policy);
    }
    if (const auto name = config.getMissingTypePolicy())
    {
        const auto policy = parsePolicy<MissingTypePolicy>(*name,
                                                           {{"raise_error", MissingTypePolicy::RaiseError},
                                                            {"use_any", MissingTypePolicy::UseAny},
                                                            {"from_default", MissingTypePolicy::FromDefault}},
                                                           "missing_type_policy",
                                                           logger);
        options.missing_type_policy = policy.value_or(options.missing_type_policy);
    }
    if (const auto dump_null_values = config.getDumpNullValues())
    {
        options.dump_null_values = *dump_null_values;
    }
    return options;
}

Context::Ptr Context::make()
{
    return make(Options{});
}

Context::Ptr Context::make(const Options& options)
{
    return std::make_shared<ContextImpl>(options);
}

}  // namespace treeconv
