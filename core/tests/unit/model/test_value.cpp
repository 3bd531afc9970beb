#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "hedl/model/value.hpp"

using hedl::Reference;
using hedl::Tensor;
using hedl::Value;
using hedl::ValueKind;

TEST(ModelValue, FactoriesSetKind)
{
  EXPECT_TRUE(Value::make_null().is_null());
  EXPECT_TRUE(Value{}.is_null());
  EXPECT_EQ(Value::make_bool(true).kind(), ValueKind::Bool);
  EXPECT_EQ(Value::make_int(-3).as_int(), -3);
  EXPECT_DOUBLE_EQ(Value::make_float(2.5).as_float(), 2.5);
  EXPECT_EQ(Value::make_string("hi").as_string(), "hi");
  EXPECT_EQ(Value::make_expression("a + b").as_string(), "a + b");
  EXPECT_TRUE(Value::make_expression("x").is_expression());
}

TEST(ModelValue, EqualityRequiresSameKind)
{
  EXPECT_NE(Value::make_int(1), Value::make_float(1.0));
  EXPECT_NE(Value::make_string("x"), Value::make_expression("x"));
  EXPECT_EQ(Value::make_string("x"), Value::make_string("x"));
  EXPECT_EQ(Value::make_null(), Value::make_null());
}

TEST(ModelValue, NanEqualsNan)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(Value::make_float(nan), Value::make_float(nan));
  EXPECT_NE(Value::make_float(nan), Value::make_float(0.0));
}

TEST(ModelValue, ReferenceForms)
{
  const Reference local = Reference::local("alice");
  EXPECT_FALSE(local.is_qualified());
  EXPECT_EQ(local.to_ref_string(), "@alice");

  const Reference qualified = Reference::qualified("User", "alice");
  EXPECT_TRUE(qualified.is_qualified());
  EXPECT_EQ(qualified.to_ref_string(), "@User:alice");
  EXPECT_NE(local, qualified);

  const Value v = Value::make_reference(qualified);
  ASSERT_TRUE(v.is_reference());
  EXPECT_EQ(v.as_reference(), qualified);
}

TEST(ModelValue, TensorShape)
{
  const Tensor row1 = Tensor::array({Tensor::scalar(1), Tensor::scalar(2)});
  const Tensor row2 = Tensor::array({Tensor::scalar(3), Tensor::scalar(4)});
  const Tensor matrix = Tensor::array({row1, row2});

  EXPECT_EQ(matrix.shape(), (std::vector<size_t>{2, 2}));
  EXPECT_TRUE(Tensor::scalar(1.0).shape().empty());
  EXPECT_EQ(matrix, Tensor::array({row1, row2}));
  EXPECT_NE(matrix, Tensor::array({row1}));
}
