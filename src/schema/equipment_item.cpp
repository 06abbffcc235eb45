#include "iochannel/schema/equipment_item.hpp"

#include <algorithm>
#include <cctype>

namespace ioc {

double EquipmentItem::required(SignalClass signalClass) const {
    const auto it = requirements.find(signalClass);
    return (it == requirements.end()) ? 0.0 : it->second;
}

const char* toString(AlarmLevel level) {
    switch (level) {
    case AlarmLevel::LowLow:
        return "LL";
    case AlarmLevel::Low:
        return "L";
    case AlarmLevel::High:
        return "H";
    case AlarmLevel::HighHigh:
        return "HH";
    }
    return "?";
}

std::optional<AlarmLevel> parseAlarmLevel(const std::string& text) {
    std::string normalized;
    for (const unsigned char c : text) {
        if (!std::isspace(c)) {
            normalized.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    if (normalized == "LL") {
        return AlarmLevel::LowLow;
    }
    if (normalized == "L") {
        return AlarmLevel::Low;
    }
    if (normalized == "H") {
        return AlarmLevel::High;
    }
    if (normalized == "HH") {
        return AlarmLevel::HighHigh;
    }
    return std::nullopt;
}

} // namespace ioc
