//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/context.hpp"

#include "converter_mock.hpp"
#include "sample_types.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/type_descriptor.hpp"
#include "treeconv/types.hpp"
#include "treeconv_gtest_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <typeinfo>
#include <vector>

namespace
{

using namespace treeconv;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Optional;
using testing::Return;
using testing::IsNull;
using testing::NotNull;
using testing::HasSubstr;
using testing::StrictMock;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestContext : public testing::Test
{
protected:
    struct Unsupported
    {};

    /// An object type without any shape; no factory claims it.
    ///
    static TypeDescriptor unsupportedType()
    {
        return TypeDescriptor::make(TypeKind::Object, "Unsupported", typeid(Unsupported), {}, AnyShape{});
    }

    // MARK: Data members:

    // NOLINTBEGIN
    Context::Ptr context_{Context::make()};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestContext, options_defaults)
{
    const auto& options = context_->options();
    EXPECT_THAT(options.any_load_policy, AnyLoadPolicy::LoadAsIs);
    EXPECT_THAT(options.any_dump_policy, AnyDumpPolicy::DumpAsIs);
    EXPECT_THAT(options.missing_type_policy, MissingTypePolicy::RaiseError);
    EXPECT_THAT(options.dump_null_values, Eq(true));
}

TEST_F(TestContext, converters_are_cached)
{
    const auto first = context_->getConverter(typeOf<std::vector<sample::Point>>());
    EXPECT_THAT(first, NotNull());
    EXPECT_THAT(context_->getConverter(typeOf<std::vector<sample::Point>>()), Eq(first));

    // The primitives are pre-registered.
    const auto integer = context_->getConverter(TypeDescriptor::primitive(PrimitiveKind::Integer));
    EXPECT_THAT(context_->getConverter(typeOf<std::int64_t>()), Eq(integer));
}

TEST_F(TestContext, any_converter)
{
    auto options            = Context::Options{};
    options.any_load_policy = AnyLoadPolicy::RaiseError;
    const auto context      = Context::make(options);

    const auto converter = context->getConverter(TypeDescriptor::any());
    EXPECT_THAT(context->getConverter(typeOf<Tree>()), Eq(converter));
    EXPECT_THAT(converter->load(parseTree("1"), {}, *context), IsFailure("any_load_forbidden"));
    EXPECT_THAT(successOf(converter->dump(Object{std::int64_t{1}}, *context)), TreeIs("1"));
}

TEST_F(TestContext, unresolvable_type)
{
    try
    {
        (void) context_->getConverter(unsupportedType());
        FAIL() << "ResolutionError expected";

    } catch (const ResolutionError& ex)
    {
        EXPECT_THAT(ex.what(), HasSubstr("No converter found for type 'Unsupported'"));
    }

    // The failed type is no longer in flight, so it's not handed out as a proxy.
    EXPECT_THROW((void) context_->getConverter(unsupportedType()), ResolutionError);

    // Nor is anything cached for a container of it.
    EXPECT_THROW((void) context_->getConverter(TypeDescriptor::make(TypeKind::Sequence,
                                                                    "list[Unsupported]",
                                                                    typeid(std::vector<Unsupported>),
                                                                    {unsupportedType()},
                                                                    SequenceShape{})),
                 ResolutionError);
}

TEST_F(TestContext, recursive_type)
{
    const auto converter = context_->getConverter(typeOf<sample::Node>());
    EXPECT_THAT(context_->getConverter(typeOf<sample::Node>()), Eq(converter));

    const auto loaded = converter->load(parseTree("{value: 1, next: {value: 2, next: {value: 3}}}"), {}, *context_);
    ASSERT_THAT(loaded, IsSuccess());
    const auto& head = successOf<sample::Node>(loaded);
    EXPECT_THAT(head.value, 1);
    ASSERT_THAT(head.next, NotNull());
    ASSERT_THAT(head.next->next, NotNull());
    EXPECT_THAT(head.next->next->value, 3);
    EXPECT_THAT(head.next->next->next, IsNull());

    EXPECT_THAT(successOf(converter->dump(Object{head}, *context_)),
                TreeIs("{value: 1, next: {value: 2, next: {value: 3, next: ~}}}"));
}

TEST_F(TestContext, deep_recursive_data)
{
    constexpr std::int64_t depth = 5000;

    auto root   = tree::makeMap();
    auto cursor = root;
    for (std::int64_t i = 0; i < depth; ++i)
    {
        cursor["value"] = tree::makeInteger(i);
        if (i + 1 < depth)
        {
            auto child     = tree::makeMap();
            cursor["next"] = child;
            cursor.reset(child);
        }
    }

    const auto converter = context_->getConverter(typeOf<sample::Node>());
    const auto loaded    = converter->load(root, {}, *context_);
    ASSERT_THAT(loaded, IsSuccess());

    std::int64_t        count = 0;
    const sample::Node* node  = &successOf<sample::Node>(loaded);
    while (node != nullptr)
    {
        EXPECT_THAT(node->value, count);
        ++count;
        node = node->next.get();
    }
    EXPECT_THAT(count, depth);

    const auto dumped = converter->dump(Object{successOf<sample::Node>(loaded)}, *context_);
    ASSERT_THAT(dumped, IsSuccess());

    std::int64_t dumped_count = 0;
    Tree         level        = successOf(dumped);
    while (tree::kindOf(level) == tree::NodeKind::Map)
    {
        const Tree& current = level;
        EXPECT_THAT(tree::asInteger(current["value"]), Optional(dumped_count));
        ++dumped_count;
        level.reset(current["next"]);
    }
    EXPECT_THAT(dumped_count, depth);
}

TEST_F(TestContext, added_converter_takes_precedence)
{
    const auto converter = std::make_shared<StrictMock<ConverterMock>>();
    context_->addConverter(typeOf<sample::Point>(), converter);

    EXPECT_THAT(context_->getConverter(typeOf<sample::Point>()), Eq(converter));

    // Also for the types which refer to it.
    EXPECT_CALL(*converter, load(_, _, _)).WillOnce(Return(Object{sample::Point{4, 2}}));
    const auto loaded = context_->getConverter(typeOf<std::vector<sample::Point>>())->load(parseTree("[x]"),
                                                                                           {},
                                                                                           *context_);
    ASSERT_THAT(loaded, IsSuccess());
    EXPECT_THAT(successOf<std::vector<sample::Point>>(loaded), testing::ElementsAre(sample::Point{4, 2}));
}

TEST_F(TestContext, appended_factory_is_last_resort)
{
    const auto factory   = std::make_shared<StrictMock<ConverterFactoryMock>>();
    const auto converter = std::make_shared<StrictMock<ConverterMock>>();
    context_->addFactory(factory);

    // Claimed by a default factory, so never reaches the appended one.
    EXPECT_THAT(context_->getConverter(typeOf<std::vector<std::int64_t>>()), NotNull());

    EXPECT_CALL(*factory, tryCreateConverter(unsupportedType(), _)).WillOnce(Return(converter));
    EXPECT_THAT(context_->getConverter(unsupportedType()), Eq(converter));
}

TEST_F(TestContext, inserted_factory_takes_precedence)
{
    const auto factory   = std::make_shared<StrictMock<ConverterFactoryMock>>();
    const auto converter = std::make_shared<StrictMock<ConverterMock>>();
    context_->insertFactory(0, factory);

    const auto list_type = typeOf<std::vector<std::int64_t>>();
    EXPECT_CALL(*factory, tryCreateConverter(list_type, _)).WillOnce(Return(converter));
    EXPECT_THAT(context_->getConverter(list_type), Eq(converter));

    // Declined types go on down the chain.
    EXPECT_CALL(*factory, tryCreateConverter(typeOf<std::set<std::string>>(), _)).WillOnce(Return(nullptr));
    EXPECT_THAT(context_->getConverter(typeOf<std::set<std::string>>()), NotNull());
}

TEST_F(TestContext, inserted_factory_position_is_clamped)
{
    const auto factory   = std::make_shared<StrictMock<ConverterFactoryMock>>();
    const auto converter = std::make_shared<StrictMock<ConverterMock>>();
    context_->insertFactory(100, factory);

    EXPECT_THAT(context_->getConverter(typeOf<sample::Point>()), NotNull());

    EXPECT_CALL(*factory, tryCreateConverter(unsupportedType(), _)).WillOnce(Return(converter));
    EXPECT_THAT(context_->getConverter(unsupportedType()), Eq(converter));
}

TEST_F(TestContext, providers)
{
    const auto point_type = typeOf<sample::Point>();
    EXPECT_THAT(context_->getProvider(point_type), IsNull());

    const auto factory  = std::make_shared<StrictMock<ProviderFactoryMock>>();
    const auto provider = std::make_shared<StrictMock<ProviderMock>>();
    context_->addProviderFactory(factory);

    EXPECT_CALL(*factory, canProvide(point_type)).WillOnce(Return(true));
    EXPECT_CALL(*factory, createProvider(point_type, _)).WillOnce(Return(provider));
    EXPECT_THAT(context_->getProvider(point_type), Eq(provider));

    // Cached from now on.
    EXPECT_THAT(context_->getProvider(point_type), Eq(provider));

    EXPECT_CALL(*factory, canProvide(typeOf<sample::Dog>())).WillOnce(Return(false));
    EXPECT_THAT(context_->getProvider(typeOf<sample::Dog>()), IsNull());

    // Registered providers are found without asking the factories.
    const auto cat_provider = std::make_shared<StrictMock<ProviderMock>>();
    context_->addProvider(typeOf<sample::Cat>(), cat_provider);
    EXPECT_THAT(context_->getProvider(typeOf<sample::Cat>()), Eq(cat_provider));
}

TEST_F(TestContext, provider_replaces_object_attribute_converter)
{
    const auto provider = std::make_shared<StrictMock<ProviderMock>>();
    context_->addProvider(typeOf<std::vector<std::string>>(), provider);

    const auto converter = context_->getConverter(typeOf<sample::Person>());

    EXPECT_CALL(*provider, provide(_)).WillOnce(Return(Object{std::vector<std::string>{"given"}}));
    const auto loaded = converter->load(parseTree("{name: Gil, tags: [ignored]}"), {}, *context_);
    ASSERT_THAT(loaded, IsSuccess());
    EXPECT_THAT(successOf<sample::Person>(loaded).tags, testing::ElementsAre("given"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
