#include "vertical_regrid.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

const double kNaN = std::numeric_limits<double>::quiet_NaN();

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[vertical-regrid-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[vertical-regrid-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

bool same_or_both_nan(double a, double b)
{
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

int test_standard_grid()
{
    int failures = 0;
    const std::vector<double> grid = make_standard_grid();
    failures += expect_true(grid.size() == 1201, "default grid has 1201 levels");
    failures += expect_close(grid.front(), 0.0, "grid starts at 0");
    failures += expect_close(grid.back(), 6000.0, "grid ends at 6000");
    failures += expect_true(is_strictly_increasing(grid), "grid is strictly increasing");

    bool threw = false;
    try
    {
        (void)make_standard_grid(0.0, 10.0, 0.0);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "zero step must throw");
    return failures;
}

int test_linear_data_is_reproduced()
{
    int failures = 0;
    const std::vector<double> p = {0.0, 10.0, 20.0, 30.0};
    const std::vector<double> v = {0.0, 20.0, 40.0, 60.0};
    const std::vector<double> grid = make_standard_grid(0.0, 40.0, 5.0);

    const std::vector<double> out = regrid_one(v, p, grid);
    failures += expect_true(out.size() == grid.size(), "one value per grid level");
    for (std::size_t i = 0; i < grid.size(); ++i)
    {
        if (grid[i] <= 30.0)
        {
            failures += expect_close(out[i], 2.0 * grid[i], "linear interior", 1.0e-10);
        }
        else
        {
            failures += expect_true(std::isnan(out[i]), "no extrapolation below the deepest sample");
        }
    }

    RegridOptions options;
    options.extrapolation = Extrapolation::Pchip;
    const std::vector<double> extended = regrid_one(v, p, grid, options);
    failures += expect_close(extended.back(), 80.0, "extrapolation extends the end cubic", 1.0e-10);
    return failures;
}

int test_order_invariance()
{
    int failures = 0;
    const std::vector<double> p = {0.0, 7.0, 15.0, 40.0, 55.0};
    const std::vector<double> v = {20.0, 19.5, 15.0, 9.0, 8.5};
    const std::vector<double> p_shuffled = {40.0, 0.0, 55.0, 15.0, 7.0};
    const std::vector<double> v_shuffled = {9.0, 20.0, 8.5, 15.0, 19.5};
    const std::vector<double> grid = make_standard_grid(0.0, 60.0, 5.0);

    const std::vector<double> a = regrid_one(v, p, grid);
    const std::vector<double> b = regrid_one(v_shuffled, p_shuffled, grid);
    for (std::size_t i = 0; i < grid.size(); ++i)
    {
        failures += expect_true(same_or_both_nan(a[i], b[i]), "input order must not change the result");
    }
    return failures;
}

int test_degenerate_inputs()
{
    int failures = 0;
    const std::vector<double> grid = make_standard_grid(0.0, 20.0, 5.0);

    const std::vector<double> single = regrid_one({1.0, kNaN, 3.0}, {0.0, 5.0, kNaN}, grid);
    for (double value : single)
    {
        failures += expect_true(std::isnan(value), "one usable sample gives all NaN");
    }

    const std::vector<double> same_p = regrid_one({1.0, 3.0}, {5.0, 5.0}, grid);
    for (double value : same_p)
    {
        failures += expect_true(std::isnan(value), "one distinct pressure gives all NaN");
    }

    const std::vector<double> empty = regrid_one({}, {}, grid);
    failures += expect_true(empty.size() == grid.size(), "empty profile still yields a full row");

    bool threw = false;
    try
    {
        (void)regrid_one({1.0, 2.0}, {0.0}, grid);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "size mismatch must throw");

    threw = false;
    try
    {
        (void)regrid_batch({{1.0, 2.0}}, {}, grid);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "batch list mismatch must throw");
    return failures;
}

int test_duplicates_and_two_points()
{
    int failures = 0;
    const std::vector<double> grid = {0.0, 5.0, 10.0, 15.0, 20.0};

    const std::vector<double> dup = regrid_one({0.0, 10.0, 30.0, 40.0}, {0.0, 10.0, 10.0, 20.0}, grid);
    failures += expect_close(dup[2], 20.0, "repeated pressure values are averaged", 1.0e-10);
    failures += expect_close(dup[4], 40.0, "deepest level after dedup", 1.0e-10);

    const std::vector<double> two = regrid_one({0.0, 10.0}, {0.0, 10.0}, grid);
    failures += expect_close(two[1], 5.0, "two samples interpolate linearly", 1.0e-12);
    failures += expect_true(std::isnan(two[3]), "two samples do not extrapolate");
    return failures;
}

int test_shape_preservation()
{
    int failures = 0;
    const PchipInterpolant step({0.0, 1.0, 2.0, 3.0}, {0.0, 0.0, 1.0, 1.0});
    for (int i = 0; i <= 300; ++i)
    {
        const double x = 0.01 * static_cast<double>(i);
        const double y = step(x);
        failures += expect_true(y >= -1.0e-12 && y <= 1.0 + 1.0e-12, "no overshoot around a step");
    }
    failures += expect_close(step.slopes()[1], 0.0, "slope vanishes at a flat neighbour");

    const PchipInterpolant rising({0.0, 1.0, 3.0}, {0.0, 1.0, 4.0});
    const double w1 = 2.0 * 2.0 + 1.0;
    const double w2 = 2.0 + 2.0 * 1.0;
    failures += expect_close(rising.slopes()[1], (w1 + w2) / (w1 / 1.0 + w2 / 1.5),
                             "weighted harmonic mean slope");

    bool threw = false;
    try
    {
        const PchipInterpolant bad({0.0, 0.0}, {1.0, 2.0});
        (void)bad;
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "non-increasing abscissae must throw");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_standard_grid();
    failures += test_linear_data_is_reproduced();
    failures += test_order_invariance();
    failures += test_degenerate_inputs();
    failures += test_duplicates_and_two_points();
    failures += test_shape_preservation();

    if (failures > 0)
    {
        std::cerr << "[vertical-regrid-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[vertical-regrid-regression] all checks passed" << std::endl;
    return 0;
}
