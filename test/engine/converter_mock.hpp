//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_CONVERTER_MOCK_HPP_INCLUDED
#define TREECONV_CONVERTER_MOCK_HPP_INCLUDED

#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"

#include <gmock/gmock.h>

namespace treeconv
{

class ConverterMock : public Converter
{
public:
    MOCK_METHOD(LoadResult::Var, load, (const Tree& data, const Key& key, Context& context), (const, override));
    MOCK_METHOD(DumpResult::Var, dump, (const Object& value, Context& context), (const, override));

};  // ConverterMock

class ConverterFactoryMock : public ConverterFactory
{
public:
    MOCK_METHOD(Converter::Ptr,
                tryCreateConverter,
                (const TypeDescriptor& type, Context& context),
                (const, override));

};  // ConverterFactoryMock

class ProviderMock : public Provider
{
public:
    MOCK_METHOD(Object, provide, (Context & context), (const, override));

};  // ProviderMock

class ProviderFactoryMock : public ProviderFactory
{
public:
    MOCK_METHOD(bool, canProvide, (const TypeDescriptor& type), (const, override));
    MOCK_METHOD(Provider::Ptr, createProvider, (const TypeDescriptor& type, Context& context), (const, override));

};  // ProviderFactoryMock

}  // namespace treeconv

#endif  // TREECONV_CONVERTER_MOCK_HPP_INCLUDED
