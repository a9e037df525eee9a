//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/converters.hpp"

#include "converter_mock.hpp"
#include "sample_types.hpp"
#include "treeconv/context.hpp"
#include "treeconv/converter.hpp"
#include "treeconv/errors.hpp"
#include "treeconv/factories.hpp"
#include "treeconv/object.hpp"
#include "treeconv/tree.hpp"
#include "treeconv/types.hpp"
#include "treeconv_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace
{

using namespace treeconv;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Return;
using testing::NotNull;
using testing::HasSubstr;
using testing::StrictMock;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDiscriminatedConverter : public testing::Test
{
protected:
    Converter::Ptr makePetsConverter(const std::string& tag_key = "type")
    {
        return makeDiscriminatedConverter({{"cat", typeOf<sample::Cat>(), context_->getConverter(typeOf<sample::Cat>())},
                                           {"dog", typeOf<sample::Dog>(), context_->getConverter(typeOf<sample::Dog>())}},
                                          tag_key);
    }

    void insertPetsFactory()
    {
        context_->insertFactory(0,
                                makeDiscriminatedConverterFactory({{"cat", typeOf<sample::Cat>()},
                                                                   {"dog", typeOf<sample::Dog>()}},
                                                                  makeObjectConverterFactory(MissingTypePolicy::RaiseError,
                                                                                             true)));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    Context::Ptr context_{Context::make()};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestDiscriminatedConverter, load_by_tag)
{
    const auto converter = makePetsConverter();

    const auto cat = converter->load(parseTree("{type: cat, name: Tom}"), {}, *context_);
    ASSERT_THAT(cat, IsSuccess());
    EXPECT_THAT(successOf<sample::Cat>(cat).name, Eq("Tom"));
    EXPECT_THAT(successOf<sample::Cat>(cat).indoor, Eq(true));

    const auto dog = converter->load(parseTree("{type: dog, name: Rex, weight: 30}"), {}, *context_);
    ASSERT_THAT(dog, IsSuccess());
    EXPECT_THAT(successOf<sample::Dog>(dog).weight, 30);

    // Member failures are passed through as is.
    EXPECT_THAT(converter->load(parseTree("{type: dog, name: Rex}"), {}, *context_), IsFailure("object_load_error"));
}

TEST_F(TestDiscriminatedConverter, unknown_discriminator)
{
    const auto converter = makePetsConverter();

    const auto unknown = converter->load(parseTree("{type: bird, name: Tweety}"), Key{"pet"}, *context_);
    ASSERT_THAT(unknown, IsFailure("unknown_discriminator"));
    EXPECT_THAT(failureOf(unknown).message, Eq("No registered converter found for discriminator type=bird"));
    EXPECT_THAT(failureOf(unknown).target, Eq(cetl::optional<std::string>{"pet"}));

    const auto missing = converter->load(parseTree("{name: Tom}"), {}, *context_);
    ASSERT_THAT(missing, IsFailure("unknown_discriminator"));
    EXPECT_THAT(failureOf(missing).message, Eq("No registered converter found for discriminator type=None"));

    // Null is an empty map.
    const auto null = converter->load(parseTree("~"), {}, *context_);
    ASSERT_THAT(null, IsFailure("unknown_discriminator"));
    EXPECT_THAT(failureOf(null).message, Eq("No registered converter found for discriminator type=None"));

    EXPECT_THAT(converter->load(parseTree("[cat]"), {}, *context_), IsFailure("invalid_type"));
    EXPECT_THAT(converter->load(parseTree("cat"), {}, *context_), IsFailure("invalid_type"));
}

TEST_F(TestDiscriminatedConverter, dump_adds_tag)
{
    const auto converter = makePetsConverter();

    EXPECT_THAT(successOf(converter->dump(Object{sample::Cat{"Tom", false}}, *context_)),
                TreeIs("{type: cat, name: Tom, indoor: false}"));
    EXPECT_THAT(successOf(converter->dump(Object{sample::Dog{"Rex", 30}}, *context_)),
                TreeIs("{type: dog, name: Rex, weight: 30}"));

    const auto unmapped = converter->dump(Object{sample::Point{}}, *context_);
    ASSERT_THAT(unmapped, IsFailure("unknown_discriminator"));
    EXPECT_THAT(failureOf(unmapped).message, HasSubstr("Cannot determine discriminator value for type: "));
    EXPECT_THAT(failureOf(unmapped).message, HasSubstr("Point"));

    EXPECT_THAT(converter->dump(Object{}, *context_), IsFailure("unknown_discriminator"));
}

TEST_F(TestDiscriminatedConverter, custom_tag_key)
{
    const auto converter = makePetsConverter("kind");

    const auto dog = converter->load(parseTree("{kind: dog, name: Rex, weight: 3}"), {}, *context_);
    ASSERT_THAT(dog, IsSuccess());
    EXPECT_THAT(successOf<sample::Dog>(dog).name, Eq("Rex"));

    EXPECT_THAT(successOf(converter->dump(Object{sample::Dog{"Rex", 3}}, *context_)),
                TreeIs("{kind: dog, name: Rex, weight: 3}"));

    const auto failure = converter->load(parseTree("{type: dog}"), {}, *context_);
    EXPECT_THAT(failureOf(failure).message, Eq("No registered converter found for discriminator kind=None"));
}

TEST_F(TestDiscriminatedConverter, member_must_dump_a_map)
{
    const auto member = std::make_shared<StrictMock<ConverterMock>>();
    const auto converter =
        makeDiscriminatedConverter({{"point", typeOf<sample::Point>(), member}});

    EXPECT_CALL(*member, dump(_, _)).WillOnce(Return(tree::makeInteger(1)));
    EXPECT_THAT(converter->dump(Object{sample::Point{}}, *context_), IsFailure("invalid_type"));

    EXPECT_CALL(*member, dump(_, _)).WillOnce(Return(ErrorInfo{"Broken", "broken", cetl::nullopt, {}}));
    EXPECT_THAT(converter->dump(Object{sample::Point{}}, *context_), IsFailure("broken"));
}

TEST_F(TestDiscriminatedConverter, missing_member_converter)
{
    EXPECT_THROW((void) makeDiscriminatedConverter({{"cat", typeOf<sample::Cat>(), nullptr}}), ResolutionError);
}

TEST_F(TestDiscriminatedConverter, factory_overrides_object_factory)
{
    insertPetsFactory();

    const auto converter = context_->getConverter(typeOf<sample::Cat>());
    ASSERT_THAT(converter, NotNull());
    EXPECT_THAT(successOf(converter->dump(Object{sample::Cat{"Tom", true}}, *context_)),
                TreeIs("{type: cat, name: Tom, indoor: true}"));

    // Unmapped object types are left to the rest of the chain.
    EXPECT_THAT(successOf(context_->getConverter(typeOf<sample::Point>())->dump(Object{sample::Point{1, 2}}, *context_)),
                TreeIs("{x: 1, y: 2}"));
}

TEST_F(TestDiscriminatedConverter, factory_within_union)
{
    insertPetsFactory();

    using Pet            = cetl::variant<sample::Cat, sample::Dog>;
    const auto converter = context_->getConverter(typeOf<std::vector<Pet>>());

    const auto loaded = converter->load(parseTree("[{type: dog, name: Rex, weight: 3}, {type: cat, name: Tom}]"),
                                        {},
                                        *context_);
    ASSERT_THAT(loaded, IsSuccess());
    const auto& pets = successOf<std::vector<Pet>>(loaded);
    ASSERT_THAT(pets.size(), 2U);
    EXPECT_THAT(cetl::get_if<sample::Dog>(&pets[0]), NotNull());
    EXPECT_THAT(cetl::get_if<sample::Cat>(&pets[1]), NotNull());

    EXPECT_THAT(successOf(converter->dump(Object{pets}, *context_)),
                TreeIs("[{type: dog, name: Rex, weight: 3}, {type: cat, name: Tom, indoor: true}]"));
}

TEST_F(TestDiscriminatedConverter, factory_fails_on_declined_member)
{
    context_->insertFactory(0,
                            makeDiscriminatedConverterFactory({{"cat", typeOf<sample::Cat>()},
                                                               {"color", typeOf<sample::Color>()}},
                                                              makeObjectConverterFactory(MissingTypePolicy::RaiseError,
                                                                                         true)));

    EXPECT_THROW((void) context_->getConverter(typeOf<sample::Cat>()), ResolutionError);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
