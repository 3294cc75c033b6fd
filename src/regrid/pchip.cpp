/**
 * @file pchip.cpp
 * @brief Monotone piecewise cubic Hermite interpolant.
 *
 * Interior slopes are the weighted harmonic mean of the neighbouring
 * secant slopes and vanish at local extrema. End slopes use the
 * one-sided three-point estimate, clipped so that monotonicity holds.
 */

#include "vertical_regrid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace
{

int sign_of(double v)
{
    return (v > 0.0) - (v < 0.0);
}

double edge_slope(double h0, double h1, double m0, double m1)
{
    double d = ((2.0 * h0 + h1) * m0 - h0 * m1) / (h0 + h1);
    if (sign_of(d) != sign_of(m0))
    {
        d = 0.0;
    }
    else if (sign_of(m0) != sign_of(m1) && std::abs(d) > 3.0 * std::abs(m0))
    {
        d = 3.0 * m0;
    }
    return d;
}

}

PchipInterpolant::PchipInterpolant(std::vector<double> x, std::vector<double> y)
    : x_(std::move(x)), y_(std::move(y))
{
    const std::size_t n = x_.size();
    if (n < 2)
    {
        throw std::invalid_argument("PchipInterpolant requires at least two samples");
    }
    if (y_.size() != n)
    {
        throw std::invalid_argument("PchipInterpolant: x and y lengths differ");
    }
    if (!is_strictly_increasing(x_))
    {
        throw std::invalid_argument("PchipInterpolant: abscissae must be strictly increasing");
    }
    for (std::size_t k = 0; k < n; ++k)
    {
        if (!std::isfinite(x_[k]) || !std::isfinite(y_[k]))
        {
            throw std::invalid_argument("PchipInterpolant: samples must be finite");
        }
    }

    std::vector<double> h(n - 1);
    std::vector<double> m(n - 1);
    for (std::size_t k = 0; k + 1 < n; ++k)
    {
        h[k] = x_[k + 1] - x_[k];
        m[k] = (y_[k + 1] - y_[k]) / h[k];
    }

    d_.assign(n, 0.0);
    if (n == 2)
    {
        d_[0] = m[0];
        d_[1] = m[0];
        return;
    }

    for (std::size_t k = 1; k + 1 < n; ++k)
    {
        if (sign_of(m[k - 1]) * sign_of(m[k]) <= 0)
        {
            d_[k] = 0.0;
            continue;
        }
        const double w1 = 2.0 * h[k] + h[k - 1];
        const double w2 = h[k] + 2.0 * h[k - 1];
        d_[k] = (w1 + w2) / (w1 / m[k - 1] + w2 / m[k]);
    }

    d_[0] = edge_slope(h[0], h[1], m[0], m[1]);
    d_[n - 1] = edge_slope(h[n - 2], h[n - 3], m[n - 2], m[n - 3]);
}

double PchipInterpolant::operator()(double xq, Extrapolation extrapolation) const
{
    if (!std::isfinite(xq))
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const bool outside = xq < x_.front() || xq > x_.back();
    if (outside && extrapolation == Extrapolation::None)
    {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // Interval k brackets xq; points outside use the end intervals.
    const auto upper = std::upper_bound(x_.begin(), x_.end(), xq);
    std::size_t k = upper == x_.begin() ? 0 : static_cast<std::size_t>(upper - x_.begin()) - 1;
    k = std::min(k, x_.size() - 2);

    const double h = x_[k + 1] - x_[k];
    const double t = (xq - x_[k]) / h;
    const double omt = 1.0 - t;
    const double h00 = (1.0 + 2.0 * t) * omt * omt;
    const double h10 = t * omt * omt;
    const double h01 = t * t * (3.0 - 2.0 * t);
    const double h11 = t * t * (t - 1.0);
    return h00 * y_[k] + h10 * h * d_[k] + h01 * y_[k + 1] + h11 * h * d_[k + 1];
}

std::vector<double> PchipInterpolant::evaluate(const std::vector<double>& xq, Extrapolation extrapolation) const
{
    std::vector<double> out(xq.size());
    for (std::size_t i = 0; i < xq.size(); ++i)
    {
        out[i] = (*this)(xq[i], extrapolation);
    }
    return out;
}
