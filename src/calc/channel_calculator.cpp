/**
 * @file channel_calculator.cpp
 * @brief iochannel source file.
 */

#include "iochannel/calc/channel_calculator.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <utility>

#include "iochannel/calc/address_format.hpp"

namespace ioc {
namespace {

constexpr const char* kReservedTagPrefix = "YLDW";

struct ExtensionSpec {
    ExtensionKind kind;
    std::optional<AlarmLevel> level;
    const char* suffix;
    const char* label;
};

constexpr AlarmLevel kLevels[] = {AlarmLevel::LowLow, AlarmLevel::Low, AlarmLevel::High, AlarmLevel::HighHigh};

ExtensionSpec setPointSpec(AlarmLevel level) {
    switch (level) {
    case AlarmLevel::LowLow:
        return {ExtensionKind::SetPoint, level, "_LoLoLimit", "SLL设定点位"};
    case AlarmLevel::Low:
        return {ExtensionKind::SetPoint, level, "_LoLimit", "SL设定点位"};
    case AlarmLevel::High:
        return {ExtensionKind::SetPoint, level, "_HiLimit", "SH设定点位"};
    case AlarmLevel::HighHigh:
        break;
    }
    return {ExtensionKind::SetPoint, AlarmLevel::HighHigh, "_HiHiLimit", "SHH设定点位"};
}

ExtensionSpec alarmSpec(AlarmLevel level) {
    switch (level) {
    case AlarmLevel::LowLow:
        return {ExtensionKind::Alarm, level, "_LL", "LL报警"};
    case AlarmLevel::Low:
        return {ExtensionKind::Alarm, level, "_L", "L报警"};
    case AlarmLevel::High:
        return {ExtensionKind::Alarm, level, "_H", "H报警"};
    case AlarmLevel::HighHigh:
        break;
    }
    return {ExtensionKind::Alarm, AlarmLevel::HighHigh, "_HH", "HH报警"};
}

bool contains(const std::vector<AlarmLevel>& levels, AlarmLevel level) {
    for (const auto candidate : levels) {
        if (candidate == level) {
            return true;
        }
    }
    return false;
}

// Set-points first, then alarm bits, then the maintenance pair.
std::vector<ExtensionSpec> extensionsFor(const EquipmentItem& item) {
    std::vector<ExtensionSpec> specs;
    for (const auto level : kLevels) {
        if (contains(item.alarmLevels, level)) {
            specs.push_back(setPointSpec(level));
        }
    }
    for (const auto level : kLevels) {
        if (contains(item.alarmLevels, level)) {
            specs.push_back(alarmSpec(level));
        }
    }
    if (item.maintenance) {
        specs.push_back({ExtensionKind::MaintenanceValue, std::nullopt, "_whz", "维护值设定点位"});
        specs.push_back({ExtensionKind::MaintenanceEnable, std::nullopt, "_MAIN_EN", "维护使能开关点位"});
    }
    return specs;
}

DataType extensionDataType(ExtensionKind kind) {
    return (kind == ExtensionKind::SetPoint || kind == ExtensionKind::MaintenanceValue) ? DataType::Real
                                                                                       : DataType::Bool;
}

bool validRequirement(double count) {
    return std::isfinite(count) && count >= 0.0 && std::floor(count) == count;
}

std::string formatCount(double count) {
    std::ostringstream os;
    os << count;
    return os.str();
}

/**
 * @brief Walks module instances and channels of one signal class.
 */
class ClassCursor {
public:
    explicit ClassCursor(std::vector<const ChannelModel*> models) : models_(std::move(models)) {}

    // Points the cursor at a free channel; false when every model is full.
    bool ensureCapacity() {
        while (modelIndex_ < models_.size()) {
            const auto* model = models_[modelIndex_];
            if (!model->bounded() || instance_ < model->maxInstances) {
                return true;
            }
            ++modelIndex_;
            instance_ = 0;
            channel_ = 0;
        }
        return false;
    }

    const ChannelModel& model() const { return *models_[modelIndex_]; }
    std::int64_t instance() const noexcept { return instance_; }
    std::int64_t channel() const noexcept { return channel_; }
    bool atModuleStart() const noexcept { return channel_ == 0; }

    void advance() {
        ++channel_;
        if (channel_ >= model().capacity) {
            channel_ = 0;
            ++instance_;
        }
    }

private:
    std::vector<const ChannelModel*> models_;
    std::size_t modelIndex_ = 0;
    std::int64_t instance_ = 0;
    std::int64_t channel_ = 0;
};

// REAL points occupy a 4-byte word, so two REAL addresses closer than that overlap.
class AddressBook {
public:
    bool claim(DataType dataType, std::int64_t address) {
        auto& used = used_[static_cast<int>(dataType)];
        const auto width = addressWidth(dataType);
        const auto it = used.lower_bound(address - width + 1);
        if (it != used.end() && *it < address + width) {
            return false;
        }
        used.insert(address);
        return true;
    }

private:
    std::set<std::int64_t> used_[2];
};

Error conflictError(const std::string& tag, DataType dataType, std::int64_t address) {
    return makeError(ErrorKind::AddressConflict, tag,
                     "address " + formatPlcAddress(dataType, address) + " is already allocated");
}

} // namespace

std::size_t CalculationResult::count(SignalClass signalClass) const {
    std::size_t total = 0;
    for (const auto& assignment : assignments) {
        if (assignment.signalClass == signalClass) {
            ++total;
        }
    }
    return total;
}

bool ChannelCalculator::calculate(const std::vector<EquipmentItem>& items,
                                  const ChannelModelCatalog& catalog,
                                  const CalculationOptions& options,
                                  CalculationResult& outResult,
                                  Error& outError) {
    outError.clear();

    // Reject bad requests before anything is allocated.
    for (const auto& item : items) {
        for (const auto& [signalClass, count] : item.requirements) {
            if (!validRequirement(count)) {
                outError = makeError(ErrorKind::InvalidRequirement, item.id,
                                     std::string("requested ") + toString(signalClass) + " count " +
                                         formatCount(count) + " is not a non-negative integer");
                return false;
            }
        }
    }

    std::vector<std::shared_ptr<const EquipmentItem>> sources;
    sources.reserve(items.size());
    for (const auto& item : items) {
        sources.push_back(std::make_shared<const EquipmentItem>(item));
    }

    CalculationResult result;
    AddressBook addresses;
    const auto& layout = catalog.rackLayout();
    std::int64_t moduleOrdinal = -1;

    for (const auto signalClass : kAllocationOrder) {
        ClassCursor cursor(catalog.modelsFor(signalClass));
        std::int64_t classModuleOrdinal = -1;

        for (std::size_t itemIndex = 0; itemIndex < items.size(); ++itemIndex) {
            const auto& item = items[itemIndex];
            const auto required = static_cast<std::int64_t>(item.required(signalClass));
            if (required == 0) {
                continue;
            }
            if (catalog.modelsFor(signalClass).empty()) {
                outError = makeError(ErrorKind::UnknownModuleType, toString(signalClass),
                                     "no module type serves signal class " + std::string(toString(signalClass)) +
                                         " requested by item " + item.id);
                return false;
            }

            for (std::int64_t ordinal = 0; ordinal < required; ++ordinal) {
                if (!cursor.ensureCapacity()) {
                    outError = makeError(ErrorKind::CapacityExhausted, item.id,
                                         std::string("all ") + toString(signalClass) +
                                             " module types reached their instance limit");
                    return false;
                }
                const auto& model = cursor.model();
                if (cursor.atModuleStart()) {
                    ++moduleOrdinal;
                    ++classModuleOrdinal;
                }

                ChannelAssignment assignment;
                assignment.moduleType = model.moduleType;
                assignment.moduleInstance = cursor.instance();
                assignment.channelIndex = cursor.channel();
                assignment.address = model.addressOf(cursor.instance(), cursor.channel());
                assignment.signalClass = signalClass;
                assignment.dataType = model.dataType();
                assignment.source = sources[itemIndex];
                assignment.itemIndex = itemIndex;

                assignment.rack = 1 + moduleOrdinal / layout.slotsPerRack;
                assignment.slot = layout.firstSlot + moduleOrdinal % layout.slotsPerRack;
                assignment.channelCode = std::to_string(assignment.rack) + "_" + std::to_string(assignment.slot) +
                                         "_" + toString(signalClass) + "_" + std::to_string(cursor.channel());
                if (item.reserved) {
                    assignment.tag = kReservedTagPrefix + assignment.channelCode;
                } else {
                    assignment.tag = item.id + "_" + toString(signalClass) + "_" +
                                     std::to_string(classModuleOrdinal) + "_" + std::to_string(cursor.channel());
                }

                if (!addresses.claim(assignment.dataType, assignment.address)) {
                    outError = conflictError(assignment.tag, assignment.dataType, assignment.address);
                    return false;
                }

                result.assignments.push_back(std::move(assignment));
                cursor.advance();
            }
        }
    }

    // Auxiliary points follow the main allocation so they never shift main addresses.
    std::int64_t nextExtension[2] = {0, 0};
    for (auto& assignment : result.assignments) {
        if (assignment.signalClass != SignalClass::AnalogInput) {
            continue;
        }
        for (const auto& spec : extensionsFor(*assignment.source)) {
            const auto dataType = extensionDataType(spec.kind);
            const auto* area = catalog.extensionArea(dataType);
            if (area == nullptr) {
                outError = makeError(ErrorKind::CapacityExhausted, assignment.source->id,
                                     std::string("catalog has no ") + toString(dataType) +
                                         " extension area for alarm/maintenance points");
                return false;
            }

            auto& next = nextExtension[static_cast<int>(dataType)];
            ExtensionPoint point;
            point.kind = spec.kind;
            point.level = spec.level;
            point.suffix = spec.suffix;
            point.label = spec.label;
            point.tag = assignment.tag + spec.suffix;
            point.dataType = dataType;
            point.address = area->baseAddress + next * area->stride;
            ++next;

            if (!addresses.claim(point.dataType, point.address)) {
                outError = conflictError(point.tag, point.dataType, point.address);
                return false;
            }
            assignment.extensions.push_back(std::move(point));
        }
    }

    result.moduleCount = static_cast<std::size_t>(moduleOrdinal + 1);
    result.rackCount = (result.moduleCount == 0U)
                           ? 0U
                           : static_cast<std::size_t>(1 + moduleOrdinal / layout.slotsPerRack);
    if (result.rackCount > options.rackCount) {
        result.warnings.push_back("I/O modules need " + std::to_string(result.rackCount) +
                                  " racks but only " + std::to_string(options.rackCount) +
                                  " are declared; add racks (" + layout.rackModel + ")");
    }

    outResult = std::move(result);
    return true;
}

bool ChannelCalculator::calculate(const ProjectInput& input,
                                  const ChannelModelCatalog& catalog,
                                  CalculationResult& outResult,
                                  Error& outError) {
    CalculationOptions options;
    options.rackCount = input.rackCount;
    return calculate(input.items, catalog, options, outResult, outError);
}

const char* toString(ExtensionKind kind) {
    switch (kind) {
    case ExtensionKind::SetPoint:
        return "SetPoint";
    case ExtensionKind::Alarm:
        return "Alarm";
    case ExtensionKind::MaintenanceValue:
        return "MaintenanceValue";
    case ExtensionKind::MaintenanceEnable:
        return "MaintenanceEnable";
    }
    return "Unknown";
}

} // namespace ioc
