#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "hedl/canonical/ditto.hpp"

using hedl::Value;
using hedl::can_use_ditto;
using hedl::ditto_mask;

TEST(CanonicalDitto, RequiresSameKindAndValue)
{
  EXPECT_TRUE(can_use_ditto(Value::make_string("A"), Value::make_string("A")));
  EXPECT_FALSE(can_use_ditto(Value::make_string("A"), Value::make_string("B")));
  EXPECT_FALSE(can_use_ditto(Value::make_int(1), Value::make_float(1.0)));
  EXPECT_TRUE(can_use_ditto(Value::make_null(), Value::make_null()));

  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(can_use_ditto(Value::make_float(nan), Value::make_float(nan)));
}

TEST(CanonicalDitto, SignedZeroIsNotRepeated)
{
  EXPECT_FALSE(can_use_ditto(Value::make_float(-0.0), Value::make_float(0.0)));
  EXPECT_FALSE(can_use_ditto(Value::make_float(0.0), Value::make_float(-0.0)));
  EXPECT_TRUE(can_use_ditto(Value::make_float(-0.0), Value::make_float(-0.0)));
  EXPECT_TRUE(can_use_ditto(Value::make_float(-2.5), Value::make_float(-2.5)));
}

TEST(CanonicalDitto, MaskPerColumn)
{
  const std::vector<Value> prev{Value::make_string("x"), Value::make_int(1), Value::make_null()};
  const std::vector<Value> cur{Value::make_string("x"), Value::make_int(2), Value::make_null()};
  EXPECT_EQ(ditto_mask(cur, prev), (std::vector<bool>{true, false, true}));
}

TEST(CanonicalDitto, ShorterPreviousRow)
{
  const std::vector<Value> prev{Value::make_int(1)};
  const std::vector<Value> cur{Value::make_int(1), Value::make_int(1)};
  EXPECT_EQ(ditto_mask(cur, prev), (std::vector<bool>{true, false}));
}
