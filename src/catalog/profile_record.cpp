#include "profile_record.hpp"

#include <cmath>

ProbeType probe_type_from_wod_code(int code)
{
    switch (code)
    {
        case 4: return ProbeType::Ctd;
        case 5: return ProbeType::Std;
        case 6: return ProbeType::Xctd;
        case 2: return ProbeType::Xtd;
        case 9: return ProbeType::Float;
        case 0: return ProbeType::Unknown;
        default: return ProbeType::ReadFail;
    }
}

const char* to_string(ProbeType probe)
{
    switch (probe)
    {
        case ProbeType::Ctd: return "CTD";
        case ProbeType::Std: return "STD";
        case ProbeType::Xctd: return "XCTD";
        case ProbeType::Xtd: return "XTD";
        case ProbeType::Float: return "FLOAT";
        case ProbeType::Unknown: return "UNKNOWN";
        case ProbeType::ReadFail: return "READ FAIL";
    }
    return "READ FAIL";
}

std::int64_t epoch_seconds_from_civil(int year, int month, int day, std::int64_t seconds_of_day)
{
    // Proleptic Gregorian day count relative to 1970-01-01.
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const std::int64_t days = era * 146097 + doe - 719468;
    return days * 86400 + seconds_of_day;
}

double mean_finite_spacing(const double* values, std::size_t count)
{
    double sum = 0.0;
    std::size_t pairs = 0;
    for (std::size_t k = 1; k < count; ++k)
    {
        const double diff = values[k] - values[k - 1];
        if (std::isfinite(diff))
        {
            sum += diff;
            ++pairs;
        }
    }
    if (pairs == 0)
    {
        return std::nan("");
    }
    return sum / static_cast<double>(pairs);
}
