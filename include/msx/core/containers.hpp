#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>

namespace msx::core {

template<typename Scalar = double>
using MathVector = Eigen::Vector<Scalar, Eigen::Dynamic>;

template<typename Scalar = double>
using MathMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

// Concentrations or right-hand sides, one entry per species in registry order
using SpeciesVector = MathVector<double>;

// d(rhs_i)/d(c_j), rows and columns in registry species order
using SpeciesJacobian = MathMatrix<double>;

// Symbol name -> numeric value, the evaluation environment of an expression
using SymbolValues = std::unordered_map<std::string, double>;

// Parameter overrides keyed by pipe or tank name, kept sorted for stable output
using SiteValues = std::map<std::string, double>;

} // namespace msx::core
