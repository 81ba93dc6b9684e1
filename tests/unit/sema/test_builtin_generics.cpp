// rapter/tests/unit/sema/test_builtin_generics.cpp - Option/Result registry tests
//
#include <gtest/gtest.h>

#include <vector>

#include "rapter/sema/types/builtin_generics.hpp"
#include "rapter/sema/types/type.hpp"

using namespace rapter;

TEST(BuiltinGenerics, KnowsOnlyOptionAndResult)
{
  const auto & g = BuiltinGenerics::instance();
  EXPECT_TRUE(g.is_builtin("Option"));
  EXPECT_TRUE(g.is_builtin("Result"));
  EXPECT_FALSE(g.is_builtin("Vec"));
  EXPECT_EQ(g.lookup("Vec"), nullptr);

  ASSERT_NE(g.lookup("Option"), nullptr);
  EXPECT_EQ(g.lookup("Option")->arity(), 1U);
  ASSERT_NE(g.lookup("Result"), nullptr);
  EXPECT_EQ(g.lookup("Result")->arity(), 2U);
}

TEST(BuiltinGenerics, VariantNamesInDeclarationOrder)
{
  const auto & g = BuiltinGenerics::instance();
  EXPECT_EQ(g.variant_names("Option"), (std::vector<std::string_view>{"Some", "None"}));
  EXPECT_EQ(g.variant_names("Result"), (std::vector<std::string_view>{"Ok", "Err"}));
}

TEST(BuiltinGenerics, SubstituteChecksArity)
{
  TypeContext types;
  const auto & g = BuiltinGenerics::instance();

  const auto ok = g.substitute(types, "Option", {types.int_type()});
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(ok.type(), types.get_generic_type("Option", {types.int_type()}));

  const auto too_many = g.substitute(types, "Option", {types.int_type(), types.int_type()});
  ASSERT_FALSE(too_many.ok());
  EXPECT_EQ(too_many.error().family, "Option");
  EXPECT_EQ(too_many.error().expected, 1U);
  EXPECT_EQ(too_many.error().actual, 2U);

  const auto too_few = g.substitute(types, "Result", {types.int_type()});
  ASSERT_FALSE(too_few.ok());
  EXPECT_EQ(too_few.error().expected, 2U);
  EXPECT_EQ(too_few.error().actual, 1U);

  const auto result = g.substitute(types, "Result", {types.int_type(), types.string_type()});
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.type()->is_generic_of("Result"));
}

TEST(BuiltinGenerics, VariantPayloadTypes)
{
  TypeContext types;
  const auto & g = BuiltinGenerics::instance();
  const std::vector<const Type *> args = {types.int_type(), types.string_type()};

  EXPECT_EQ(g.variant_value_type("Result", "Ok", args).value_or(nullptr), types.int_type());
  EXPECT_EQ(g.variant_value_type("Result", "Err", args).value_or(nullptr), types.string_type());

  const std::vector<const Type *> opt = {types.float_type()};
  EXPECT_EQ(g.variant_value_type("Option", "Some", opt).value_or(nullptr), types.float_type());
  EXPECT_FALSE(g.variant_value_type("Option", "None", opt).has_value());
  EXPECT_FALSE(g.variant_value_type("Option", "Nope", opt).has_value());
}
