//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_COMMON_HELPERS_HPP_INCLUDED
#define TREECONV_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace treeconv
{
namespace common
{

/// @brief Performs the given action, reporting (instead of propagating) an exception of the given type.
///
/// Only for `noexcept` bookkeeping paths (like logger registration).
///
/// @return `true` if the action was performed successfully, `false` if an exception was caught.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
    try
    {
        std::forward<Action>(action)();
        return true;

    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
}

}  // namespace common
}  // namespace treeconv

#endif  // TREECONV_COMMON_HELPERS_HPP_INCLUDED
