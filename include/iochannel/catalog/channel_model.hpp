/**
 * @file channel_model.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstdint>
#include <string>

#include "iochannel/core/signal_class.hpp"

namespace ioc {

/**
 * @brief One hardware I/O module type and its addressing formula.
 *
 * The address of channel `c` on module instance `i` is
 * `baseAddress + i * instanceStride + c * channelStride`. BOOL addresses are bit
 * offsets, REAL addresses are byte offsets.
 */
struct ChannelModel {
    /// Module type identifier, e.g. "LK610".
    std::string moduleType;
    SignalClass signalClass = SignalClass::DiscreteInput;
    /// Channels per module instance.
    std::int64_t capacity = 0;
    std::int64_t baseAddress = 0;
    std::int64_t channelStride = 1;
    std::int64_t instanceStride = 0;
    /// Models of the same class are tried in ascending priority.
    int priority = 0;
    /// Upper bound on module instances; 0 means unbounded.
    std::int64_t maxInstances = 0;

    DataType dataType() const noexcept { return dataTypeOf(signalClass); }
    bool bounded() const noexcept { return maxInstances > 0; }

    std::int64_t addressOf(std::int64_t instance, std::int64_t channel) const noexcept {
        return baseAddress + instance * instanceStride + channel * channelStride;
    }
};

/**
 * @brief Rack geometry used to place module instances into slots.
 */
struct RackLayout {
    /// Checklist spec-model text identifying a rack, e.g. "LK117".
    std::string rackModel = "LK117";
    std::int64_t slotsPerRack = 10;
    /// Slot 1 carries the communication module.
    std::int64_t firstSlot = 2;
};

/**
 * @brief Address area that alarm set-points, alarm bits and maintenance points are
 * allocated from, one per data type.
 */
struct ExtensionArea {
    DataType dataType = DataType::Real;
    std::int64_t baseAddress = 0;
    std::int64_t stride = 1;
};

} // namespace ioc
