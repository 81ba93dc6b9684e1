// rapter/tests/unit/codegen/test_name_mangler.cpp - Type mangling tests
//
#include <gtest/gtest.h>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/codegen/name_mangler.hpp"
#include "rapter/sema/types/type.hpp"

using namespace rapter;

TEST(NameMangler, Primitives)
{
  TypeContext types;
  EXPECT_EQ(mangle(types.int_type()), "int");
  EXPECT_EQ(mangle(types.string_type()), "string");
  EXPECT_EQ(c_type(types.float_type()), "double");
  EXPECT_EQ(c_type(types.bool_type()), "int");
  EXPECT_EQ(c_type(types.string_type()), "char*");
  EXPECT_EQ(c_type(types.get_struct_type("str")), "char*");
}

TEST(NameMangler, GenericInstantiations)
{
  TypeContext types;
  const Type * opt = types.get_generic_type("Option", {types.int_type()});
  const Type * res = types.get_generic_type("Result", {types.int_type(), types.string_type()});
  const Type * nested = types.get_generic_type("Option", {opt});

  EXPECT_EQ(mangle(opt), "Option_int");
  EXPECT_EQ(mangle(res), "Result_int_string");
  EXPECT_EQ(mangle(nested), "Option_Option_int");
  EXPECT_EQ(c_type(res), "Result_int_string");

  EXPECT_EQ(variant_tag(opt, "Some"), "Option_int_Some");
  EXPECT_EQ(variant_macro(opt, "None"), "Option_int_NONE");
  EXPECT_EQ(variant_field("Err"), "err_value");
}

TEST(NameMangler, CompositeTypes)
{
  TypeContext types;
  const Type * point = types.get_struct_type("geo.Point");

  EXPECT_EQ(mangle(types.get_pointer_type(types.int_type())), "ptr_int");
  EXPECT_EQ(mangle(types.get_array_type(types.char_type())), "arr_char");
  EXPECT_EQ(mangle(types.get_dynamic_array_type(point)), "vec_Point");

  EXPECT_EQ(c_type(types.get_pointer_type(point)), "Point*");
  EXPECT_EQ(c_type(types.get_array_type(types.float_type())), "double*");
  EXPECT_EQ(c_type(types.get_pointer_type(types.string_type())), "char**");
}

TEST(NameMangler, DynamicArrayNames)
{
  TypeContext types;
  EXPECT_EQ(dynamic_array_name(types.int_type()), "DynamicArray_int");
  EXPECT_EQ(dynamic_array_name(types.bool_type()), "DynamicArray_int");
  EXPECT_EQ(dynamic_array_name(types.float_type()), "DynamicArray_double");
  EXPECT_EQ(dynamic_array_name(types.string_type()), "DynamicArray_charptr");
  EXPECT_EQ(dynamic_array_name(types.get_struct_type("Point")), "DynamicArray_Point");

  EXPECT_TRUE(is_primitive_dynamic_array(types.char_type()));
  EXPECT_FALSE(is_primitive_dynamic_array(types.get_struct_type("Point")));
}

TEST(NameMangler, EnumConstants)
{
  EXPECT_EQ(enum_constant("Color", "Red"), "COLOR_RED");
  EXPECT_EQ(enum_constant("ui.Color", "DarkBlue"), "COLOR_DARKBLUE");
}

TEST(NameMangler, TypeParameterIsInternalError)
{
  TypeContext types;
  const Type * t = types.get_type_param("T");
  try {
    (void)mangle(t);
    FAIL() << "expected CompileError";
  } catch (const CompileError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::InternalError);
  }
  EXPECT_THROW((void)c_type(t), CompileError);
}
