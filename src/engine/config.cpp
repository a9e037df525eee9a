//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace treeconv
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getAnyLoadPolicy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("conversion", "any_load_policy");
    }

    auto getAnyDumpPolicy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("conversion", "any_dump_policy");
    }

    auto getMissingTypePolicy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("conversion", "missing_type_policy");
    }

    auto getDumpNullValues() const -> cetl::optional<bool> override
    {
        return findImpl<bool>("conversion", "dump_null_values");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            // Absent key or a value of another type.
            return cetl::nullopt;
        }
    }

    std::string file_path_;
    TomlValue   root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace treeconv
