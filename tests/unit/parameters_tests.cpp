#include "strategy/parameters.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace tbot
{
namespace
{
std::vector<OptionSpec> sample_options()
{
  OptionSpec mode{"mode", ParamType::String, std::string("fast"), std::nullopt, std::nullopt,
                  {"fast", "slow"}, "replay mode"};
  OptionSpec verbose{"verbose", ParamType::Bool, false, std::nullopt, std::nullopt, {}, ""};
  return {int_option("period", 14, 1, 500, "length"), double_option("level", 30, 0, 100, "level"),
          verbose, mode};
}

TEST(ParametersTest, DefaultsFillMissingOptions)
{
  Result<ParameterSet> p = validate_parameters(sample_options(), ParameterSet{});
  ASSERT_TRUE(p.ok());
  EXPECT_EQ(p.value().get_int("period"), 14);
  EXPECT_DOUBLE_EQ(p.value().get_double("level"), 30.0);
  EXPECT_FALSE(p.value().get_bool("verbose"));
  EXPECT_EQ(p.value().get_string("mode"), "fast");
}

TEST(ParametersTest, SuppliedValuesOverrideDefaults)
{
  ParameterSet in;
  in.set("period", i64{20});
  in.set("level", 25.5);
  in.set("mode", std::string("slow"));
  Result<ParameterSet> p = validate_parameters(sample_options(), in);
  ASSERT_TRUE(p.ok());
  EXPECT_EQ(p.value().get_int("period"), 20);
  EXPECT_DOUBLE_EQ(p.value().get_double("level"), 25.5);
  EXPECT_EQ(p.value().get_string("mode"), "slow");
}

TEST(ParametersTest, IntegerWidensForDoubleOption)
{
  ParameterSet in;
  in.set("level", i64{40});
  Result<ParameterSet> p = validate_parameters(sample_options(), in);
  ASSERT_TRUE(p.ok());
  EXPECT_TRUE(std::holds_alternative<double>(p.value().values().at("level")));
  EXPECT_DOUBLE_EQ(p.value().get_double("level"), 40.0);
}

TEST(ParametersTest, RejectsUnknownWrongTypeAndOutOfRange)
{
  ParameterSet unknown;
  unknown.set("periodd", i64{3});
  EXPECT_EQ(validate_parameters(sample_options(), unknown).status().code,
            ErrorCode::InvalidParameters);

  ParameterSet wrong_type;
  wrong_type.set("period", 2.5);
  EXPECT_EQ(validate_parameters(sample_options(), wrong_type).status().code,
            ErrorCode::InvalidParameters);

  ParameterSet too_small;
  too_small.set("period", i64{0});
  EXPECT_EQ(validate_parameters(sample_options(), too_small).status().code,
            ErrorCode::InvalidParameters);

  ParameterSet too_big;
  too_big.set("level", 100.5);
  EXPECT_EQ(validate_parameters(sample_options(), too_big).status().code,
            ErrorCode::InvalidParameters);

  ParameterSet not_finite;
  not_finite.set("level", std::numeric_limits<double>::infinity());
  EXPECT_EQ(validate_parameters(sample_options(), not_finite).status().code,
            ErrorCode::InvalidParameters);

  ParameterSet bad_choice;
  bad_choice.set("mode", std::string("medium"));
  EXPECT_EQ(validate_parameters(sample_options(), bad_choice).status().code,
            ErrorCode::InvalidParameters);
}

TEST(ParametersTest, BoundsAreInclusive)
{
  ParameterSet in;
  in.set("period", i64{1});
  in.set("level", 100.0);
  EXPECT_TRUE(validate_parameters(sample_options(), in).ok());
}

TEST(ParametersTest, ParsesTextByOptionType)
{
  const std::vector<OptionSpec> opts = sample_options();
  Result<ParamValue> i = parse_param(opts[0], "42");
  ASSERT_TRUE(i.ok());
  EXPECT_EQ(std::get<i64>(i.value()), 42);

  Result<ParamValue> d = parse_param(opts[1], "12.75");
  ASSERT_TRUE(d.ok());
  EXPECT_DOUBLE_EQ(std::get<double>(d.value()), 12.75);

  Result<ParamValue> b = parse_param(opts[2], "true");
  ASSERT_TRUE(b.ok());
  EXPECT_TRUE(std::get<bool>(b.value()));

  EXPECT_EQ(parse_param(opts[0], "4x").status().code, ErrorCode::InvalidParameters);
  EXPECT_EQ(parse_param(opts[0], "").status().code, ErrorCode::InvalidParameters);
  EXPECT_EQ(parse_param(opts[1], "abc").status().code, ErrorCode::InvalidParameters);
  EXPECT_EQ(parse_param(opts[2], "yes").status().code, ErrorCode::InvalidParameters);
}

TEST(ParametersTest, FormatsForLogs)
{
  ParameterSet p;
  p.set("slow_period", i64{50});
  p.set("fast_period", i64{20});
  p.set("ratio", 0.5);
  EXPECT_EQ(format_params(p), "fast_period=20 ratio=0.5 slow_period=50");
  EXPECT_EQ(format_param(ParamValue{true}), "true");
}
} // namespace
} // namespace tbot
