/**
 * @file calculation_cache.cpp
 * @brief iochannel source file.
 */

#include "iochannel/calc/calculation_cache.hpp"

#include <cstring>
#include <string>

namespace ioc {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

class Fnv1a {
public:
    void bytes(const void* data, std::size_t size) {
        const auto* p = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            hash_ ^= p[i];
            hash_ *= kFnvPrime;
        }
    }

    void text(const std::string& value) {
        number(static_cast<std::uint64_t>(value.size()));
        bytes(value.data(), value.size());
    }

    void number(std::uint64_t value) { bytes(&value, sizeof(value)); }

    void real(double value) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        number(bits);
    }

    std::uint64_t value() const noexcept { return hash_; }

private:
    std::uint64_t hash_ = kFnvOffset;
};

} // namespace

CalculationCache::CalculationCache(std::size_t capacity) : capacity_(capacity == 0U ? 1U : capacity) {}

std::uint64_t CalculationCache::fingerprint(const std::vector<EquipmentItem>& items,
                                            const ChannelModelCatalog& catalog,
                                            const CalculationOptions& options) {
    Fnv1a h;
    // Full catalog content; loaded catalogs may share or omit a version.
    h.text(catalog.version());
    h.number(static_cast<std::uint64_t>(catalog.models().size()));
    for (const auto& model : catalog.models()) {
        h.text(model.moduleType);
        h.number(static_cast<std::uint64_t>(model.signalClass));
        h.number(static_cast<std::uint64_t>(model.capacity));
        h.number(static_cast<std::uint64_t>(model.baseAddress));
        h.number(static_cast<std::uint64_t>(model.channelStride));
        h.number(static_cast<std::uint64_t>(model.instanceStride));
        h.number(static_cast<std::uint64_t>(model.priority));
        h.number(static_cast<std::uint64_t>(model.maxInstances));
    }
    const auto& layout = catalog.rackLayout();
    h.text(layout.rackModel);
    h.number(static_cast<std::uint64_t>(layout.slotsPerRack));
    h.number(static_cast<std::uint64_t>(layout.firstSlot));
    h.number(static_cast<std::uint64_t>(catalog.extensionAreas().size()));
    for (const auto& area : catalog.extensionAreas()) {
        h.number(static_cast<std::uint64_t>(area.dataType));
        h.number(static_cast<std::uint64_t>(area.baseAddress));
        h.number(static_cast<std::uint64_t>(area.stride));
    }

    h.number(static_cast<std::uint64_t>(options.rackCount));
    h.number(static_cast<std::uint64_t>(items.size()));
    for (const auto& item : items) {
        h.text(item.id);
        h.text(item.name);
        h.text(item.location);
        h.text(item.specModel);
        h.real(item.quantity);
        h.number(static_cast<std::uint64_t>(item.requirements.size()));
        for (const auto& [signalClass, count] : item.requirements) {
            h.number(static_cast<std::uint64_t>(signalClass));
            h.real(count);
        }
        h.number(item.range ? 1U : 0U);
        if (item.range) {
            h.real(item.range->low);
            h.real(item.range->high);
        }
        h.number(static_cast<std::uint64_t>(item.alarmLevels.size()));
        for (const auto level : item.alarmLevels) {
            h.number(static_cast<std::uint64_t>(level));
        }
        h.number(item.maintenance ? 1U : 0U);
        h.number(item.reserved ? 1U : 0U);
    }
    return h.value();
}

bool CalculationCache::calculate(const std::vector<EquipmentItem>& items,
                                 const ChannelModelCatalog& catalog,
                                 const CalculationOptions& options,
                                 CalculationResult& outResult,
                                 Error& outError) {
    const auto key = fingerprint(items, catalog, options);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.first == key) {
                ++hits_;
                outResult = entry.second;
                outError.clear();
                return true;
            }
        }
        ++misses_;
    }

    // Calculation runs outside the lock; a concurrent miss on the same key only wastes work.
    CalculationResult result;
    if (!ChannelCalculator::calculate(items, catalog, options, result, outError)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool present = false;
    for (const auto& entry : entries_) {
        present = present || entry.first == key;
    }
    if (!present) {
        if (entries_.size() >= capacity_) {
            entries_.pop_front();
        }
        entries_.emplace_back(key, result);
    }
    outResult = std::move(result);
    return true;
}

std::size_t CalculationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::uint64_t CalculationCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::uint64_t CalculationCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void CalculationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

} // namespace ioc
