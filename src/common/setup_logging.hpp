//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_COMMON_SETUP_LOGGING_HPP_INCLUDED
#define TREECONV_COMMON_SETUP_LOGGING_HPP_INCLUDED

#include "logging.hpp"
#include "treeconv/config.hpp"

#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <string>

namespace treeconv
{
namespace common
{

/// Applies the `[logging] level` setting (like `treeconv=debug`) of the configuration file.
///
/// The engine logger is registered first, so that the level applies to it as well.
///
inline void setupLogging(const Config& config)
{
    constexpr std::size_t max_levels_len = 512;

    const auto logging_level = config.getLoggingLevel();
    if (!logging_level || logging_level->empty() || (logging_level->size() > max_levels_len))
    {
        return;
    }

    (void) getLogger("treeconv");
    try
    {
        spdlog::cfg::helpers::load_levels(logging_level.value());

    } catch (const std::exception& ex)
    {
        spdlog::error("Failed to apply logging levels '{}': {}", logging_level.value(), ex.what());
    }
}

}  // namespace common
}  // namespace treeconv

#endif  // TREECONV_COMMON_SETUP_LOGGING_HPP_INCLUDED
