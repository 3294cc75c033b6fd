/**
 * @file factory.cpp
 * @brief Equation-of-state scheme selection.
 */

#include "factory.hpp"
#include "schemes/linear/linear.hpp"
#include "schemes/seos/seos.hpp"
#include "string_utils.hpp"
#include <stdexcept>

std::unique_ptr<EquationOfStateScheme> create_seos_scheme()
{
    return std::make_unique<SeosScheme>();
}

std::unique_ptr<EquationOfStateScheme> create_linear_eos_scheme()
{
    return std::make_unique<LinearEosScheme>();
}

std::unique_ptr<EquationOfStateScheme> create_equation_of_state(const std::string& scheme_id)
{
    const std::string normalized_id = wpdb::strutil::normalize_id(scheme_id);

    if (normalized_id == "seos" || normalized_id == "s-eos")
    {
        return create_seos_scheme();
    }
    else if (normalized_id == "linear")
    {
        return create_linear_eos_scheme();
    }
    else if (normalized_id == "none" || normalized_id.empty())
    {
        return nullptr;
    }
    else
    {
        throw std::runtime_error("Unknown equation-of-state scheme: " + scheme_id +
                                 ". Available schemes: 'seos', 'linear', 'none'");
    }
}
