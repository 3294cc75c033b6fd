#pragma once
#include "../../include/equation_of_state_base.hpp"
#include <memory>
#include <string>

/**
 * @brief Factory function declarations for equation-of-state schemes
 */

/**
 * @brief Create the S-EOS scheme
 * @return Unique pointer to an uninitialized S-EOS scheme
 */
std::unique_ptr<EquationOfStateScheme> create_seos_scheme();

/**
 * @brief Create the linear equation-of-state scheme
 * @return Unique pointer to an uninitialized linear scheme
 */
std::unique_ptr<EquationOfStateScheme> create_linear_eos_scheme();
