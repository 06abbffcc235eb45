/**
 * @file equipment_builder.cpp
 * @brief iochannel source file.
 */

#include "iochannel/schema/equipment_builder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ioc {
namespace {

constexpr std::array<std::pair<const char*, SignalClass>, 4> kCountFields = {{
    {field_ids::kDiCount, SignalClass::DiscreteInput},
    {field_ids::kDoCount, SignalClass::DiscreteOutput},
    {field_ids::kAiCount, SignalClass::AnalogInput},
    {field_ids::kAoCount, SignalClass::AnalogOutput},
}};

std::string ordinalId(std::size_t ordinal) {
    std::ostringstream os;
    os << "EQ" << std::setw(3) << std::setfill('0') << ordinal;
    return os.str();
}

bool parseAlarmLevels(const std::string& text, std::vector<AlarmLevel>& outLevels, std::string& outBad) {
    std::string normalized = text;
    // Full-width comma (U+FF0C) as typed in Chinese input methods.
    const std::string fullWidthComma = "\xEF\xBC\x8C";
    for (auto pos = normalized.find(fullWidthComma); pos != std::string::npos;
         pos = normalized.find(fullWidthComma, pos)) {
        normalized.replace(pos, fullWidthComma.size(), ",");
    }
    std::replace_if(normalized.begin(), normalized.end(),
                    [](char c) { return c == '/' || c == ';' || c == '|'; }, ',');

    std::vector<AlarmLevel> levels;
    std::stringstream stream(normalized);
    std::string token;
    while (std::getline(stream, token, ',')) {
        if (token.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        const auto level = parseAlarmLevel(token);
        if (!level) {
            outBad = token;
            return false;
        }
        if (std::find(levels.begin(), levels.end(), *level) == levels.end()) {
            levels.push_back(*level);
        }
    }
    std::sort(levels.begin(), levels.end());
    outLevels = std::move(levels);
    return true;
}

bool buildItem(const TypedRecord& record,
               std::size_t ordinal,
               const std::string& station,
               const ChannelModelCatalog& catalog,
               EquipmentItem& outItem,
               std::optional<double>& outRackQuantity,
               Error& outError) {
    using namespace field_ids;

    EquipmentItem item;
    item.id = record.textOr(kEquipmentId, ordinalId(ordinal));
    item.name = record.textOr(kEquipmentName, "");
    item.location = station;
    item.specModel = record.textOr(kSpecModel, "");
    item.quantity = record.number(kQuantity).value_or(0.0);

    bool explicitCounts = false;
    for (const auto& [fieldId, signalClass] : kCountFields) {
        if (const auto count = record.number(fieldId)) {
            item.requirements[signalClass] = *count;
            explicitCounts = true;
        }
    }

    outRackQuantity.reset();
    if (!explicitCounts) {
        const auto& rackModel = catalog.rackLayout().rackModel;
        if (const auto signalType = record.text(kSignalType)) {
            if (const auto signalClass = parseSignalClass(*signalType)) {
                item.requirements[*signalClass] = item.quantity;
            }
        } else if (const auto* model = catalog.matchSpecModel(item.specModel)) {
            item.requirements[model->signalClass] = item.quantity * static_cast<double>(model->capacity);
            item.reserved = true;
        } else if (!rackModel.empty() && item.specModel.find(rackModel) != std::string::npos) {
            outRackQuantity = item.quantity;
        }
    }

    const auto low = record.number(kRangeLow);
    const auto high = record.number(kRangeHigh);
    if (low && high) {
        item.range = EngineeringRange{*low, *high};
    }

    if (const auto alarms = record.text(kAlarmLevels)) {
        std::string bad;
        if (!parseAlarmLevels(*alarms, item.alarmLevels, bad)) {
            outError = makeError(ErrorKind::SchemaMismatch, kAlarmLevels,
                                 "item " + item.id + ": unknown alarm level '" + bad + "'");
            return false;
        }
    }

    if (const auto maintenance = record.text(kMaintenance)) {
        item.maintenance = (*maintenance == "是" || *maintenance == "yes");
    }

    outItem = std::move(item);
    return true;
}

} // namespace

bool EquipmentItemBuilder::fromRecords(const TypedRecord& mainRecord,
                                       const std::vector<TypedRecord>& equipmentRecords,
                                       const ChannelModelCatalog& catalog,
                                       ProjectInput& outInput,
                                       Error& outError) {
    using namespace field_ids;
    outError.clear();

    ProjectInput input;
    input.project.name = mainRecord.textOr(kProjectName, "");
    input.project.number = mainRecord.textOr(kProjectNumber, "");
    input.project.designNumber = mainRecord.textOr(kDesignNumber, "");
    input.project.client = mainRecord.textOr(kClientName, "");
    input.project.station = mainRecord.textOr(kStation, "");

    std::optional<double> declaredRacks;
    input.items.reserve(equipmentRecords.size());
    for (std::size_t i = 0; i < equipmentRecords.size(); ++i) {
        EquipmentItem item;
        std::optional<double> rackQuantity;
        if (!buildItem(equipmentRecords[i], i + 1, input.project.station, catalog, item, rackQuantity, outError)) {
            return false;
        }
        // The first rack row wins, later ones are accessories of the same rack set.
        if (rackQuantity && !declaredRacks) {
            declaredRacks = rackQuantity;
        }
        input.items.push_back(std::move(item));
    }

    if (declaredRacks && *declaredRacks >= 1.0) {
        input.rackCount = static_cast<std::size_t>(std::floor(*declaredRacks));
    }

    outInput = std::move(input);
    return true;
}

bool EquipmentItemBuilder::fromPayloads(const FieldSchemaRegistry& registry,
                                        const RawPayload& mainPayload,
                                        const std::vector<RawPayload>& equipmentPayloads,
                                        const ChannelModelCatalog& catalog,
                                        ProjectInput& outInput,
                                        Error& outError) {
    outError.clear();

    TypedRecord mainRecord;
    if (!registry.interpret(mainPayload, FormKind::Main, mainRecord, outError)) {
        outError.message = "main form: " + outError.message;
        return false;
    }

    std::vector<TypedRecord> equipmentRecords;
    equipmentRecords.reserve(equipmentPayloads.size());
    for (std::size_t i = 0; i < equipmentPayloads.size(); ++i) {
        TypedRecord record;
        if (!registry.interpret(equipmentPayloads[i], FormKind::Equipment, record, outError)) {
            outError.message = "equipment row " + std::to_string(i + 1) + ": " + outError.message;
            return false;
        }
        equipmentRecords.push_back(std::move(record));
    }

    return fromRecords(mainRecord, equipmentRecords, catalog, outInput, outError);
}

} // namespace ioc
