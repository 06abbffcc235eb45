/**
 * @file signal_class.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace ioc {

/**
 * @brief Category of an I/O point.
 */
enum class SignalClass { DiscreteInput, DiscreteOutput, AnalogInput, AnalogOutput };

/**
 * @brief PLC data type of a point; selects the address area (bit or byte offsets).
 */
enum class DataType { Bool, Real };

/// Order in which signal classes are allocated and emitted.
inline constexpr std::array<SignalClass, 4> kAllocationOrder = {
    SignalClass::AnalogInput,
    SignalClass::AnalogOutput,
    SignalClass::DiscreteInput,
    SignalClass::DiscreteOutput,
};

DataType dataTypeOf(SignalClass signalClass) noexcept;
bool isDiscrete(SignalClass signalClass) noexcept;

/// Address units one point occupies: 1 bit for BOOL, a 4-byte word for REAL.
std::int64_t addressWidth(DataType dataType) noexcept;

/// Short code: "DI", "DO", "AI" or "AO".
const char* toString(SignalClass signalClass);
/// "BOOL" or "REAL".
const char* toString(DataType dataType);

std::optional<SignalClass> parseSignalClass(const std::string& text);
std::optional<DataType> parseDataType(const std::string& text);

} // namespace ioc
