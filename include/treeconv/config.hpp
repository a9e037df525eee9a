//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_CONFIG_HPP_INCLUDED
#define TREECONV_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace treeconv
{

/// Conversion settings, read from a TOML file.
///
/// Every getter returns `nullopt` when the key is absent (or holds a value of another type).
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Parses the given TOML file.
    ///
    /// @throws std::exception (`toml::file_io_error`, `toml::syntax_error`) if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getAnyLoadPolicy() const -> cetl::optional<std::string>     = 0;
    CETL_NODISCARD virtual auto getAnyDumpPolicy() const -> cetl::optional<std::string>     = 0;
    CETL_NODISCARD virtual auto getMissingTypePolicy() const -> cetl::optional<std::string> = 0;
    CETL_NODISCARD virtual auto getDumpNullValues() const -> cetl::optional<bool>           = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;

protected:
    Config() = default;

};  // Config

}  // namespace treeconv

#endif  // TREECONV_CONFIG_HPP_INCLUDED
