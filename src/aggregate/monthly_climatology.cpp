/**
 * @file monthly_climatology.cpp
 * @brief Month-by-month aggregation over a shared catalog.
 */

#include "radius_aggregator.hpp"

#include <iostream>

#include "logging.hpp"

std::vector<AggregateResult> aggregate_monthly(const Catalog& catalog,
                                               const MonthlyQueryPoints& points_by_month,
                                               const AggregationConfig& config,
                                               const EquationOfStateScheme& scheme)
{
    std::vector<AggregateResult> out;
    out.reserve(points_by_month.size());
    const CatalogView everything = catalog.all();

    for (int month = 1; month <= 12; ++month)
    {
        const CatalogView month_view = everything.with_month(month);
        if (log_normal_enabled())
        {
            std::cout << "Month " << month << ": " << month_view.size() << " profiles, "
                      << points_by_month[static_cast<std::size_t>(month - 1)].size() << " query points"
                      << std::endl;
        }
        out.push_back(aggregate_within_radius(month_view,
                                              points_by_month[static_cast<std::size_t>(month - 1)],
                                              config,
                                              scheme));
    }
    return out;
}
