#pragma once

#include <cassert>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @file stat_field3d.hpp
 * @brief Contiguous (point, level, channel) container for aggregated statistics.
 *
 * Row-major storage: the channel index varies fastest, then the grid
 * level, then the query point. A freshly sized field is filled with NaN
 * so that untouched slots read as missing.
 */

class StatField3D
{
public:
    /**
     * @brief Constructs an empty field.
     */
    StatField3D() : NP_(0), NL_(0), NC_(0) {}

    /**
     * @brief Constructs a NaN-filled field.
     * @param np Number of query points.
     * @param nl Number of grid levels.
     * @param nc Number of channels.
     */
    StatField3D(std::size_t np, std::size_t nl, std::size_t nc) : NP_(np), NL_(nl), NC_(nc)
    {
        data_.assign(checked_size(np, nl, nc), std::numeric_limits<double>::quiet_NaN());
    }

    StatField3D(const StatField3D& other) = default;
    StatField3D& operator=(const StatField3D& other) = default;

    /**
     * @brief Move constructor.
     */
    StatField3D(StatField3D&& other) noexcept
        : NP_(other.NP_), NL_(other.NL_), NC_(other.NC_), data_(std::move(other.data_))
    {
        other.NP_ = other.NL_ = other.NC_ = 0;
    }

    /**
     * @brief Move assignment.
     */
    StatField3D& operator=(StatField3D&& other) noexcept
    {
        if (this != &other)
        {
            NP_ = other.NP_;
            NL_ = other.NL_;
            NC_ = other.NC_;
            data_ = std::move(other.data_);
            other.NP_ = other.NL_ = other.NC_ = 0;
        }
        return *this;
    }

    /**
     * @brief Resizes storage and refills it with NaN.
     */
    void resize(std::size_t np, std::size_t nl, std::size_t nc)
    {
        data_.assign(checked_size(np, nl, nc), std::numeric_limits<double>::quiet_NaN());
        NP_ = np;
        NL_ = nl;
        NC_ = nc;
    }

    std::size_t size_points() const { return NP_; }
    std::size_t size_levels() const { return NL_; }
    std::size_t size_channels() const { return NC_; }
    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    double* data() { return data_.data(); }
    const double* data() const { return data_.data(); }

    double& operator()(std::size_t p, std::size_t l, std::size_t c) { return data_[flatten_index(p, l, c)]; }
    const double& operator()(std::size_t p, std::size_t l, std::size_t c) const { return data_[flatten_index(p, l, c)]; }

    /**
     * @brief Copies the level profile of one point and channel.
     */
    std::vector<double> column(std::size_t p, std::size_t c) const
    {
        std::vector<double> out(NL_);
        for (std::size_t l = 0; l < NL_; ++l)
        {
            out[l] = (*this)(p, l, c);
        }
        return out;
    }

private:
    std::size_t flatten_index(std::size_t p, std::size_t l, std::size_t c) const
    {
        assert(p < NP_ && l < NL_ && c < NC_);
        return (p * NL_ + l) * NC_ + c;
    }

    static std::size_t checked_size(std::size_t np, std::size_t nl, std::size_t nc)
    {
        if (np != 0 && nl > std::numeric_limits<std::size_t>::max() / np)
        {
            throw std::overflow_error("StatField3D size overflow on np*nl");
        }

        const std::size_t np_nl = np * nl;
        if (np_nl != 0 && nc > std::numeric_limits<std::size_t>::max() / np_nl)
        {
            throw std::overflow_error("StatField3D size overflow on np*nl*nc");
        }

        return np_nl * nc;
    }

    std::size_t NP_;
    std::size_t NL_;
    std::size_t NC_;
    std::vector<double> data_;
};
