#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace msx::constants {

// ================================================================================================
// HYDRAULIC VARIABLES
// ================================================================================================

namespace hydraulics {
struct HydraulicVariableInfo {
  std::string_view name;
  std::string_view note;
};

/// Hydraulic variables supplied by the hydraulic engine at every quality step
inline constexpr std::array<HydraulicVariableInfo, 9> variables{{
    {"D", "pipe diameter (feet or meters)"},
    {"Kc", "pipe roughness coefficient (unitless for Hazen-Williams or Chezy-Manning head loss formulas, "
           "millifeet or millimeters for Darcy-Weisbach head loss formula)"},
    {"Q", "pipe flow rate (flow units)"},
    {"U", "pipe flow velocity (ft/sec or m/sec)"},
    {"Re", "flow Reynolds number"},
    {"Us", "pipe shear velocity (ft/sec or m/sec)"},
    {"Ff", "Darcy-Weisbach friction factor"},
    {"Av", "surface area per unit volume (area units/L)"},
    {"Len", "pipe length (feet or meters)"},
}};
}  // namespace hydraulics

// ================================================================================================
// EXPRESSION LANGUAGE
// ================================================================================================

namespace expression {
/// Built-in function names, lower case spelling
inline constexpr std::array<std::string_view, 19> function_names{
    "abs",  "sgn",  "sqrt", "step", "log",  "exp",  "sin",  "cos",  "tan", "cot",
    "asin", "acos", "atan", "acot", "sinh", "cosh", "tanh", "coth", "log10"};

/// Names used internally by the symbolic layer for operators and literals (case sensitive)
inline constexpr std::array<std::string_view, 5> algebra_names{"Mul", "Add", "Pow", "Integer", "Float"};

/// Note attached to pre-registered function placeholders
inline constexpr std::string_view function_note = "MSX function";

/// Environment variable selecting the expression backend
inline constexpr const char* backend_environment_variable = "MSX_EXPRESSION_BACKEND";
}  // namespace expression

// ================================================================================================
// SOLVER OPTION DEFAULTS
// ================================================================================================

namespace options {
/// Water quality time step [s]
inline constexpr int default_timestep = 360;

/// Absolute concentration tolerance
inline constexpr double default_atol = 1.0e-4;

/// Relative concentration tolerance
inline constexpr double default_rtol = 1.0e-4;

/// Maximum number of segments per pipe
inline constexpr int default_segments = 5000;

/// Peclet number threshold for applying dispersion
inline constexpr int default_peclet = 1000;

/// Smallest accepted time step [s]
inline constexpr int min_timestep = 1;

/// Prefix stripped from toolkit-style option names
inline constexpr std::string_view toolkit_prefix = "MSX_";
}  // namespace options

// ================================================================================================
// ARRAY AND INDEXING CONSTANTS
// ================================================================================================

namespace indexing {
/// First array index
inline constexpr std::size_t first = 0;

/// Second array index
inline constexpr std::size_t second = 1;
}  // namespace indexing

// ================================================================================================
// APPLICATION
// ================================================================================================

namespace application {
inline constexpr int exit_success = 0;
inline constexpr int exit_failure = 1;
inline constexpr int exit_usage = 2;

inline constexpr const char* version = "1.0.0";
}  // namespace application

}  // namespace msx::constants
