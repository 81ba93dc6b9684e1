// rapter/tests/unit/sema/test_type_model.cpp - Type interning and compatibility tests
//
#include <gtest/gtest.h>

#include <vector>

#include "rapter/sema/types/type.hpp"
#include "rapter/sema/types/type_utils.hpp"

using namespace rapter;

namespace
{

class TypeModelTest : public ::testing::Test
{
protected:
  TypeContext types;

  /// A spread of types covering every compatibility rule.
  std::vector<const Type *> corpus()
  {
    const Type * point = types.get_struct_type("Point");
    const Type * geo_point = types.get_struct_type("geo.Point");
    const Type * other_point = types.get_struct_type("other.Point");
    return {
      types.int_type(),
      types.float_type(),
      types.bool_type(),
      types.char_type(),
      types.string_type(),
      types.void_type(),
      types.get_struct_type("str"),
      point,
      geo_point,
      other_point,
      types.get_enum_type("Point"),
      types.get_enum_type("Color"),
      types.get_pointer_type(types.int_type()),
      types.get_pointer_type(point),
      types.get_pointer_type(geo_point),
      types.get_array_type(types.string_type()),
      types.get_array_type(types.get_struct_type("str")),
      types.get_dynamic_array_type(types.int_type()),
      types.get_dynamic_array_type(types.float_type()),
      types.get_generic_type("Option", {types.int_type()}),
      types.get_generic_type("Option", {types.float_type()}),
      types.get_generic_type("Result", {types.int_type(), types.string_type()}),
      types.get_type_param("T"),
    };
  }
};

}  // namespace

TEST_F(TypeModelTest, InterningMakesStructuralEqualityIdentity)
{
  EXPECT_EQ(types.get_pointer_type(types.int_type()), types.get_pointer_type(types.int_type()));
  EXPECT_EQ(
    types.get_generic_type("Result", {types.int_type(), types.string_type()}),
    types.get_generic_type("Result", {types.int_type(), types.string_type()}));
  EXPECT_NE(
    types.get_generic_type("Option", {types.int_type()}),
    types.get_generic_type("Option", {types.float_type()}));
  EXPECT_NE(types.get_struct_type("Point"), types.get_enum_type("Point"));

  const size_t before = types.composite_count();
  (void)types.get_dynamic_array_type(types.get_struct_type("Interned"));
  (void)types.get_dynamic_array_type(types.get_struct_type("Interned"));
  EXPECT_EQ(types.composite_count(), before + 2);
}

TEST_F(TypeModelTest, LookupBuiltin)
{
  EXPECT_EQ(types.lookup_builtin("int"), types.int_type());
  EXPECT_EQ(types.lookup_builtin("string"), types.string_type());
  EXPECT_EQ(types.lookup_builtin("Point"), nullptr);
}

TEST_F(TypeModelTest, CompatibilityIsReflexiveAndSymmetric)
{
  const auto all = corpus();
  for (const Type * a : all) {
    EXPECT_TRUE(compatible(a, a)) << to_string(a);
    for (const Type * b : all) {
      EXPECT_EQ(compatible(a, b), compatible(b, a)) << to_string(a) << " vs " << to_string(b);
    }
  }
}

TEST_F(TypeModelTest, AcceptedPairs)
{
  // Struct vs Enum of the same name
  EXPECT_TRUE(compatible(types.get_struct_type("Color"), types.get_enum_type("Color")));
  // string vs str
  EXPECT_TRUE(compatible(types.string_type(), types.get_struct_type("str")));
  // Qualified vs unqualified
  EXPECT_TRUE(compatible(types.get_struct_type("geo.Point"), types.get_struct_type("Point")));
  // Structural descent
  EXPECT_TRUE(compatible(
    types.get_pointer_type(types.get_struct_type("geo.Point")),
    types.get_pointer_type(types.get_struct_type("Point"))));
  EXPECT_TRUE(compatible(
    types.get_array_type(types.string_type()),
    types.get_array_type(types.get_struct_type("str"))));
}

TEST_F(TypeModelTest, RejectedPairs)
{
  EXPECT_FALSE(compatible(types.int_type(), types.float_type()));
  EXPECT_FALSE(compatible(types.char_type(), types.string_type()));
  EXPECT_FALSE(compatible(types.get_struct_type("Point"), types.get_enum_type("Color")));
  EXPECT_FALSE(compatible(
    types.get_pointer_type(types.int_type()), types.get_array_type(types.int_type())));
  EXPECT_FALSE(compatible(
    types.get_array_type(types.int_type()), types.get_dynamic_array_type(types.int_type())));
  EXPECT_FALSE(compatible(
    types.get_generic_type("Option", {types.int_type()}),
    types.get_generic_type("Option", {types.float_type()})));
  EXPECT_FALSE(compatible(types.int_type(), nullptr));
}

TEST_F(TypeModelTest, CompatibilityIsNotTransitive)
{
  const Type * a = types.get_struct_type("geo.Point");
  const Type * b = types.get_struct_type("Point");
  const Type * c = types.get_struct_type("other.Point");

  EXPECT_TRUE(compatible(a, b));
  EXPECT_TRUE(compatible(b, c));
  // Both sides qualified
  EXPECT_FALSE(compatible(a, c));
}

TEST_F(TypeModelTest, RendersSourceSyntax)
{
  EXPECT_EQ(to_string(types.int_type()), "int");
  EXPECT_EQ(to_string(types.get_pointer_type(types.int_type())), "*int");
  EXPECT_EQ(to_string(types.get_array_type(types.string_type())), "[string]");
  EXPECT_EQ(to_string(types.get_dynamic_array_type(types.int_type())), "DynamicArray[int]");
  EXPECT_EQ(
    to_string(types.get_generic_type("Result", {types.int_type(), types.string_type()})),
    "Result<int, string>");
  EXPECT_EQ(to_string(types.get_struct_type("geo.Point")), "geo.Point");
  EXPECT_EQ(to_string(nullptr), "<unknown>");
}

TEST_F(TypeModelTest, NumericPromotion)
{
  EXPECT_EQ(common_numeric_type(types, types.int_type(), types.int_type()), types.int_type());
  EXPECT_EQ(common_numeric_type(types, types.int_type(), types.float_type()), types.float_type());
  EXPECT_EQ(common_numeric_type(types, types.float_type(), types.int_type()), types.float_type());
  EXPECT_EQ(common_numeric_type(types, types.string_type(), types.int_type()), nullptr);
}

TEST_F(TypeModelTest, NameHelpers)
{
  EXPECT_TRUE(is_qualified_name("geo.Point"));
  EXPECT_FALSE(is_qualified_name("Point"));
  EXPECT_EQ(unqualified_name("a.b.Point"), "Point");
  EXPECT_EQ(unqualified_name("Point"), "Point");

  EXPECT_TRUE(contains_type_param(
    types.get_generic_type("Option", {types.get_pointer_type(types.get_type_param("T"))})));
  EXPECT_FALSE(contains_type_param(types.get_generic_type("Option", {types.int_type()})));
}
