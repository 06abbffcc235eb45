/**
 * @file calculation_cache.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

#include "iochannel/calc/channel_calculator.hpp"

namespace ioc {

/**
 * @brief Memoizes calculation runs keyed by a fingerprint of the item sequence,
 * catalog content (version, models, rack layout, extension areas) and options.
 *
 * Thread-safe. Only successful runs are stored; the oldest entry is evicted once
 * `capacity` is reached.
 */
class CalculationCache {
public:
    explicit CalculationCache(std::size_t capacity = 16);

    /**
     * @brief Return a cached result or run `ChannelCalculator::calculate` and store it.
     */
    bool calculate(const std::vector<EquipmentItem>& items,
                   const ChannelModelCatalog& catalog,
                   const CalculationOptions& options,
                   CalculationResult& outResult,
                   Error& outError);

    static std::uint64_t fingerprint(const std::vector<EquipmentItem>& items,
                                     const ChannelModelCatalog& catalog,
                                     const CalculationOptions& options);

    std::size_t size() const;
    std::uint64_t hits() const;
    std::uint64_t misses() const;
    void clear();

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::pair<std::uint64_t, CalculationResult>> entries_;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};

} // namespace ioc
