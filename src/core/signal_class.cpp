#include "iochannel/core/signal_class.hpp"

#include <algorithm>
#include <cctype>

namespace ioc {
namespace {

std::string upperTrimmed(const std::string& text) {
    std::string value = text;
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

DataType dataTypeOf(SignalClass signalClass) noexcept {
    return isDiscrete(signalClass) ? DataType::Bool : DataType::Real;
}

bool isDiscrete(SignalClass signalClass) noexcept {
    return signalClass == SignalClass::DiscreteInput || signalClass == SignalClass::DiscreteOutput;
}

std::int64_t addressWidth(DataType dataType) noexcept {
    return (dataType == DataType::Real) ? 4 : 1;
}

const char* toString(SignalClass signalClass) {
    switch (signalClass) {
    case SignalClass::DiscreteInput:
        return "DI";
    case SignalClass::DiscreteOutput:
        return "DO";
    case SignalClass::AnalogInput:
        return "AI";
    case SignalClass::AnalogOutput:
        return "AO";
    }
    return "??";
}

const char* toString(DataType dataType) {
    switch (dataType) {
    case DataType::Bool:
        return "BOOL";
    case DataType::Real:
        return "REAL";
    }
    return "UNKNOWN";
}

std::optional<SignalClass> parseSignalClass(const std::string& text) {
    const auto normalized = upperTrimmed(text);
    if (normalized == "DI") {
        return SignalClass::DiscreteInput;
    }
    if (normalized == "DO") {
        return SignalClass::DiscreteOutput;
    }
    if (normalized == "AI") {
        return SignalClass::AnalogInput;
    }
    if (normalized == "AO") {
        return SignalClass::AnalogOutput;
    }
    return std::nullopt;
}

std::optional<DataType> parseDataType(const std::string& text) {
    const auto normalized = upperTrimmed(text);
    if (normalized == "BOOL") {
        return DataType::Bool;
    }
    if (normalized == "REAL") {
        return DataType::Real;
    }
    return std::nullopt;
}

} // namespace ioc
