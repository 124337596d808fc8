#include "msx/expression/builtin_functions.hpp"
#include "msx/core/constants.hpp"
#include "msx/core/exceptions.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace msx::expression {

namespace {

auto sgn(double x) -> double {
  if (x > 0.0) {
    return 1.0;
  }
  if (x < 0.0) {
    return -1.0;
  }
  return 0.0;
}

// Heaviside step with step(0) = 0
auto step(double x) -> double { return x <= 0.0 ? 0.0 : 1.0; }

auto cot(double x) -> double { return 1.0 / std::tan(x); }
auto acot(double x) -> double { return std::atan(1.0 / x); }
auto coth(double x) -> double { return 1.0 / std::tanh(x); }

auto f_abs(double x) -> double { return std::fabs(x); }
auto f_sqrt(double x) -> double { return std::sqrt(x); }
auto f_log(double x) -> double { return std::log(x); }
auto f_exp(double x) -> double { return std::exp(x); }
auto f_sin(double x) -> double { return std::sin(x); }
auto f_cos(double x) -> double { return std::cos(x); }
auto f_tan(double x) -> double { return std::tan(x); }
auto f_asin(double x) -> double { return std::asin(x); }
auto f_acos(double x) -> double { return std::acos(x); }
auto f_atan(double x) -> double { return std::atan(x); }
auto f_sinh(double x) -> double { return std::sinh(x); }
auto f_cosh(double x) -> double { return std::cosh(x); }
auto f_tanh(double x) -> double { return std::tanh(x); }
auto f_log10(double x) -> double { return std::log10(x); }

// Same order as constants::expression::function_names
constexpr std::array<BuiltinFunction, 19> functions{{
    {"abs", f_abs},   {"sgn", sgn},     {"sqrt", f_sqrt}, {"step", step},     {"log", f_log},
    {"exp", f_exp},   {"sin", f_sin},   {"cos", f_cos},   {"tan", f_tan},     {"cot", cot},
    {"asin", f_asin}, {"acos", f_acos}, {"atan", f_atan}, {"acot", acot},     {"sinh", f_sinh},
    {"cosh", f_cosh}, {"tanh", f_tanh}, {"coth", coth},   {"log10", f_log10},
}};

static_assert(functions.size() == constants::expression::function_names.size());

} // namespace

auto lower_case(std::string_view text) -> std::string {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto upper_case(std::string_view text) -> std::string {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

auto capitalized(std::string_view text) -> std::string {
  std::string out = lower_case(text);
  if (!out.empty()) {
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  }
  return out;
}

auto find_function(std::string_view name) -> const BuiltinFunction* {
  const std::string lower = lower_case(name);
  for (const auto& function : functions) {
    if (function.name != lower) {
      continue;
    }
    if (name == lower || name == upper_case(lower) || name == capitalized(lower)) {
      return &function;
    }
    return nullptr;
  }
  return nullptr;
}

auto function_spellings() -> const std::vector<std::string>& {
  static const std::vector<std::string> spellings = [] {
    std::vector<std::string> out;
    out.reserve(functions.size() * 3);
    for (const auto& function : functions) {
      out.emplace_back(function.name);
      out.push_back(upper_case(function.name));
      out.push_back(capitalized(function.name));
    }
    return out;
  }();
  return spellings;
}

auto is_hydraulic_variable(std::string_view name) -> bool {
  return std::ranges::any_of(constants::hydraulics::variables,
                             [name](const auto& variable) { return variable.name == name; });
}

auto reserved_names() -> const std::vector<std::string>& {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& variable : constants::hydraulics::variables) {
      out.emplace_back(variable.name);
    }
    const auto& spellings = function_spellings();
    out.insert(out.end(), spellings.begin(), spellings.end());
    for (const auto name : constants::expression::algebra_names) {
      out.emplace_back(name);
    }
    return out;
  }();
  return names;
}

auto is_reserved_name(std::string_view name) -> bool {
  return std::ranges::find(reserved_names(), name) != reserved_names().end();
}

void validate_user_name(std::string_view name) {
  if (name.empty()) {
    throw core::InvalidNameError(name, "names must not be empty");
  }
  if (std::ranges::any_of(name, [](unsigned char c) { return std::isspace(c) != 0; })) {
    throw core::InvalidNameError(name, "names must not contain whitespace");
  }
  if (is_reserved_name(name)) {
    throw core::InvalidNameError(name, "this name is reserved");
  }
  const std::string lower = lower_case(name);
  if (std::ranges::any_of(functions, [&lower](const auto& function) { return function.name == lower; })) {
    throw core::InvalidNameError(name, "this name is a built-in function");
  }
}

} // namespace msx::expression
