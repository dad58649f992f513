#pragma once
#include "common/status.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tbot
{
using ParamValue = std::variant<i64, double, bool, std::string>;

enum class ParamType : u8
{
  Int,
  Double,
  Bool,
  String
};

inline const char *to_string(ParamType t) noexcept
{
  switch (t)
  {
  case ParamType::Int:
    return "int";
  case ParamType::Double:
    return "double";
  case ParamType::Bool:
    return "bool";
  case ParamType::String:
    return "string";
  }
  return "?";
}

// One recognised strategy option: its type, default and constraints.
struct OptionSpec
{
  std::string name;
  ParamType type{ParamType::Double};
  ParamValue default_value{0.0};
  std::optional<double> min{};          // numeric options only, inclusive
  std::optional<double> max{};          // numeric options only, inclusive
  std::vector<std::string> choices{};   // string options only, empty = any
  std::string help{};
};

// Upper bound for any indicator length option; keeps periods well inside int.
constexpr double kMaxPeriod = 1'000'000;

inline OptionSpec int_option(std::string name, i64 def, std::optional<double> min,
                             std::optional<double> max, std::string help)
{
  return OptionSpec{std::move(name), ParamType::Int, def, min, max, {}, std::move(help)};
}

inline OptionSpec double_option(std::string name, double def, std::optional<double> min,
                                std::optional<double> max, std::string help)
{
  return OptionSpec{std::move(name), ParamType::Double, def, min, max, {}, std::move(help)};
}

// Validated parameter values, every declared option present.
class ParameterSet
{
  std::map<std::string, ParamValue> values_;

public:
  ParameterSet() = default;
  explicit ParameterSet(std::map<std::string, ParamValue> v) : values_(std::move(v)) {}

  void set(const std::string &name, ParamValue v)
  {
    values_[name] = std::move(v);
  }

  bool has(const std::string &name) const
  {
    return values_.count(name) != 0;
  }

  // Typed accessors expect validated sets; Int values widen to double.
  i64 get_int(const std::string &name) const
  {
    return std::get<i64>(values_.at(name));
  }

  double get_double(const std::string &name) const
  {
    const ParamValue &v = values_.at(name);
    if (std::holds_alternative<i64>(v))
      return static_cast<double>(std::get<i64>(v));
    return std::get<double>(v);
  }

  bool get_bool(const std::string &name) const
  {
    return std::get<bool>(values_.at(name));
  }

  const std::string &get_string(const std::string &name) const
  {
    return std::get<std::string>(values_.at(name));
  }

  const std::map<std::string, ParamValue> &values() const noexcept
  {
    return values_;
  }
};

inline std::string format_param(const ParamValue &v)
{
  if (std::holds_alternative<i64>(v))
    return std::to_string(std::get<i64>(v));
  if (std::holds_alternative<double>(v))
  {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", std::get<double>(v));
    return buf;
  }
  if (std::holds_alternative<bool>(v))
    return std::get<bool>(v) ? "true" : "false";
  return std::get<std::string>(v);
}

// "a=1 b=2.5" for logs and reports.
inline std::string format_params(const ParameterSet &p)
{
  std::string out;
  for (const auto &kv : p.values())
  {
    if (!out.empty())
      out += ' ';
    out += kv.first + '=' + format_param(kv.second);
  }
  return out;
}

// Parses a command-line or config string into the option's type.
inline Result<ParamValue> parse_param(const OptionSpec &spec, const std::string &text)
{
  auto bad = [&] {
    return Status::error(ErrorCode::InvalidParameters,
                         spec.name + ": '" + text + "' is not a " + to_string(spec.type));
  };
  char *end = nullptr;
  switch (spec.type)
  {
  case ParamType::Int:
  {
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0')
      return bad();
    return ParamValue{static_cast<i64>(v)};
  }
  case ParamType::Double:
  {
    const double v = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0')
      return bad();
    return ParamValue{v};
  }
  case ParamType::Bool:
    if (text == "true" || text == "1")
      return ParamValue{true};
    if (text == "false" || text == "0")
      return ParamValue{false};
    return bad();
  case ParamType::String:
    return ParamValue{text};
  }
  return bad();
}

// Checks supplied values against the declared options and fills in defaults.
// Unknown names, wrong types and constraint violations are InvalidParameters. An Int value is
// accepted for a Double option.
inline Result<ParameterSet> validate_parameters(const std::vector<OptionSpec> &options,
                                                const ParameterSet &supplied)
{
  for (const auto &kv : supplied.values())
  {
    bool known = false;
    for (const OptionSpec &o : options)
      known = known || o.name == kv.first;
    if (!known)
      return Status::error(ErrorCode::InvalidParameters, "unknown option '" + kv.first + "'");
  }

  ParameterSet out;
  for (const OptionSpec &o : options)
  {
    ParamValue v = supplied.has(o.name) ? supplied.values().at(o.name) : o.default_value;
    switch (o.type)
    {
    case ParamType::Int:
      if (!std::holds_alternative<i64>(v))
        return Status::error(ErrorCode::InvalidParameters, o.name + " must be an integer");
      break;
    case ParamType::Double:
      if (std::holds_alternative<i64>(v))
        v = static_cast<double>(std::get<i64>(v));
      if (!std::holds_alternative<double>(v) || !std::isfinite(std::get<double>(v)))
        return Status::error(ErrorCode::InvalidParameters, o.name + " must be a finite number");
      break;
    case ParamType::Bool:
      if (!std::holds_alternative<bool>(v))
        return Status::error(ErrorCode::InvalidParameters, o.name + " must be a bool");
      break;
    case ParamType::String:
      if (!std::holds_alternative<std::string>(v))
        return Status::error(ErrorCode::InvalidParameters, o.name + " must be a string");
      if (!o.choices.empty())
      {
        bool listed = false;
        for (const std::string &c : o.choices)
          listed = listed || c == std::get<std::string>(v);
        if (!listed)
          return Status::error(ErrorCode::InvalidParameters,
                               o.name + " must be one of the declared choices");
      }
      break;
    }

    if (o.type == ParamType::Int || o.type == ParamType::Double)
    {
      const double x = std::holds_alternative<i64>(v) ? static_cast<double>(std::get<i64>(v))
                                                      : std::get<double>(v);
      if ((o.min && x < *o.min) || (o.max && x > *o.max))
        return Status::error(ErrorCode::InvalidParameters,
                             o.name + " = " + format_param(v) + " is out of range");
    }
    out.set(o.name, std::move(v));
  }
  return out;
}
} // namespace tbot
