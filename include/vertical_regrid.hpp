#pragma once

#include <cstddef>
#include <vector>

/**
 * @file vertical_regrid.hpp
 * @brief Shape-preserving regridding of profiles onto a standard pressure axis.
 *
 * Profiles are fitted with a piecewise cubic Hermite interpolant whose
 * slopes follow Fritsch-Carlson (PCHIP), so no overshoot is introduced
 * between samples. Whether levels outside the sampled pressure range are
 * extrapolated is an explicit option and is off by default.
 */

enum class Extrapolation
{
    None,
    Pchip,
};

struct RegridOptions
{
    Extrapolation extrapolation = Extrapolation::None;
};

class PchipInterpolant
{
public:
    /**
     * @brief Fits the interpolant.
     * @param x Strictly increasing abscissae, at least two.
     * @param y Ordinates, same length as x, all finite.
     * @throws std::invalid_argument on size, ordering or finiteness violations.
     */
    PchipInterpolant(std::vector<double> x, std::vector<double> y);

    /**
     * @brief Evaluates at one abscissa.
     * @return NaN outside [x.front(), x.back()] unless extrapolation is requested.
     */
    double operator()(double xq, Extrapolation extrapolation = Extrapolation::None) const;

    std::vector<double> evaluate(const std::vector<double>& xq,
                                 Extrapolation extrapolation = Extrapolation::None) const;

    const std::vector<double>& slopes() const { return d_; }

private:
    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> d_;
};

/// Upper bound on standard grid levels; 1 dbar spacing over 0-11000 dbar needs about 1e4.
inline constexpr std::size_t kMaxStandardGridLevels = 1000000;

/**
 * @brief Builds the standard pressure grid pmin, pmin + step, ..., pmax.
 * @throws std::invalid_argument when step <= 0, pmax < pmin, a bound is not finite
 *         or the grid would reach kMaxStandardGridLevels levels.
 */
std::vector<double> make_standard_grid(double pmin_dbar = 0.0, double pmax_dbar = 6000.0, double step_dbar = 5.0);

/**
 * @brief Reports whether a sequence is strictly increasing.
 */
bool is_strictly_increasing(const std::vector<double>& values);

/**
 * @brief Regrids one profile variable onto the standard grid.
 *
 * Samples with a missing value or pressure are skipped. Unsorted pressure
 * is sorted first and repeated pressures are averaged. Fewer than two
 * usable samples yield an all-NaN row.
 *
 * @param values Variable samples, NaN where missing.
 * @param pressure Pressure of each sample.
 * @param grid Strictly increasing standard grid.
 * @param options Extrapolation control.
 * @return One value per grid level.
 * @throws std::invalid_argument when values and pressure differ in length.
 */
std::vector<double> regrid_one(const std::vector<double>& values,
                               const std::vector<double>& pressure,
                               const std::vector<double>& grid,
                               const RegridOptions& options = RegridOptions{});

/**
 * @brief Regrids a batch of profiles; row i corresponds to profile i.
 * @throws std::invalid_argument when the two lists differ in length.
 */
std::vector<std::vector<double>> regrid_batch(const std::vector<std::vector<double>>& values,
                                              const std::vector<std::vector<double>>& pressures,
                                              const std::vector<double>& grid,
                                              const RegridOptions& options = RegridOptions{});
