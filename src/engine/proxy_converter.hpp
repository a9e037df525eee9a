//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_ENGINE_PROXY_CONVERTER_HPP_INCLUDED
#define TREECONV_ENGINE_PROXY_CONVERTER_HPP_INCLUDED

#include "treeconv/converter.hpp"
#include "treeconv/type_descriptor.hpp"

#include <cetl/cetl.hpp>

namespace treeconv
{
namespace engine
{

/// Makes a placeholder for the converter of a type which is still being resolved (a recursive type).
///
/// On first use the proxy gets the real converter from the context (by then cached),
/// and from then on delegates to it directly. The one-time rebind is thread safe.
///
CETL_NODISCARD Converter::Ptr makeProxyConverter(const TypeDescriptor& type);

}  // namespace engine
}  // namespace treeconv

#endif  // TREECONV_ENGINE_PROXY_CONVERTER_HPP_INCLUDED
