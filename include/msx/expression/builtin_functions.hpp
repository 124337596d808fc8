#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace msx::expression {

using UnaryFunction = double (*)(double);

struct BuiltinFunction {
  std::string_view name; // lower case spelling
  UnaryFunction evaluate;
};

// Looks up a function by one of its bound spellings: lower, UPPER or
// Capitalized. Returns nullptr for anything else.
[[nodiscard]] auto find_function(std::string_view name) -> const BuiltinFunction*;

// Every bound spelling of every function, lower, UPPER then Capitalized per function
[[nodiscard]] auto function_spellings() -> const std::vector<std::string>&;

[[nodiscard]] auto is_hydraulic_variable(std::string_view name) -> bool;

// Hydraulic variables, function spellings and algebra-internal names
[[nodiscard]] auto reserved_names() -> const std::vector<std::string>&;

[[nodiscard]] auto is_reserved_name(std::string_view name) -> bool;

/**
 * @brief Check that a name may be used for a user defined variable
 *
 * @throws core::InvalidNameError if the name is empty, contains whitespace,
 *         is reserved, or spells a function name in any letter case
 */
void validate_user_name(std::string_view name);

// Spelling variants bound for a function name
[[nodiscard]] auto lower_case(std::string_view text) -> std::string;
[[nodiscard]] auto upper_case(std::string_view text) -> std::string;
[[nodiscard]] auto capitalized(std::string_view text) -> std::string;

} // namespace msx::expression
