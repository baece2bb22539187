/**
 * @file factory.hpp
 * @brief Declarations for the coefficient scheme factory.
 *
 * This file is part of the src/coefficients subsystem.
 */

#pragma once
#include <memory>
#include <string>
#include "coefficient_scheme_base.hpp"

class FreeFitScheme;
class ConstrainedFitScheme;
class CosineRuleScheme;
class HybridScheme;

/**
 * @brief Normalizes strategy names and aliases to canonical tokens.
 */
std::string normalize_coefficient_scheme_name(std::string scheme_name);
