/**
 * @file field_schema_registry.cpp
 * @brief iochannel source file.
 */

#include "iochannel/schema/field_schema_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace ioc {
namespace {

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

std::string formatNumber(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

bool parseNumber(const std::string& text, double& out) {
    const auto trimmed = trimCopy(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size() || !std::isfinite(parsed)) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool isAbsent(const RawValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return trimCopy(*text).empty();
    }
    return false;
}

bool coerce(const FieldDefinition& definition, const RawValue& raw, TypedValue& out, std::string& outReason) {
    out = TypedValue{};
    out.type = definition.type;

    switch (definition.type) {
    case FieldType::Text:
        if (const auto* text = std::get_if<std::string>(&raw)) {
            out.text = *text;
        } else if (const auto* integer = std::get_if<std::int64_t>(&raw)) {
            out.text = std::to_string(*integer);
        } else if (const auto* real = std::get_if<double>(&raw)) {
            out.text = formatNumber(*real);
        } else if (const auto* flag = std::get_if<bool>(&raw)) {
            out.text = *flag ? "true" : "false";
        }
        return true;

    case FieldType::Number:
        if (const auto* integer = std::get_if<std::int64_t>(&raw)) {
            out.number = static_cast<double>(*integer);
        } else if (const auto* real = std::get_if<double>(&raw)) {
            if (!std::isfinite(*real)) {
                outReason = "value is not a finite number";
                return false;
            }
            out.number = *real;
        } else if (const auto* text = std::get_if<std::string>(&raw)) {
            if (!parseNumber(*text, out.number)) {
                outReason = "value '" + *text + "' is not numeric";
                return false;
            }
        } else {
            outReason = "boolean value cannot be used as a number";
            return false;
        }
        out.text = formatNumber(out.number);
        return true;

    case FieldType::Enum: {
        const auto* text = std::get_if<std::string>(&raw);
        if (text == nullptr) {
            outReason = "enumerated field expects a text value";
            return false;
        }
        const auto trimmed = trimCopy(*text);
        const auto& allowed = definition.allowedValues;
        if (std::find(allowed.begin(), allowed.end(), trimmed) == allowed.end()) {
            outReason = "value '" + trimmed + "' is not one of the allowed values";
            return false;
        }
        out.text = trimmed;
        return true;
    }
    }
    outReason = "unsupported field type";
    return false;
}

bool checkForm(const std::vector<FieldDefinition>& definitions, FormKind form, Error& outError) {
    std::unordered_set<std::string> ids;
    std::unordered_set<std::string> keys;
    for (const auto& definition : definitions) {
        if (definition.id.empty() || definition.rawKey.empty()) {
            outError = makeError(ErrorKind::SchemaMismatch, definition.id,
                                 std::string("field in ") + toString(form) + " form needs an id and a raw key");
            return false;
        }
        if (!ids.insert(definition.id).second) {
            outError = makeError(ErrorKind::SchemaMismatch, definition.id,
                                 std::string("duplicate field id in ") + toString(form) + " form");
            return false;
        }
        if (!keys.insert(definition.rawKey).second) {
            outError = makeError(ErrorKind::SchemaMismatch, definition.id,
                                 "raw key '" + definition.rawKey + "' is bound twice");
            return false;
        }
        if (definition.type == FieldType::Enum && definition.allowedValues.empty()) {
            outError = makeError(ErrorKind::SchemaMismatch, definition.id,
                                 "enumerated field declares no allowed values");
            return false;
        }
    }
    return true;
}

FieldDefinition field(const char* id, const char* displayName, FieldType type, const char* rawKey,
                      bool required = false, std::vector<std::string> allowedValues = {}) {
    FieldDefinition definition;
    definition.id = id;
    definition.displayName = displayName;
    definition.type = type;
    definition.rawKey = rawKey;
    definition.required = required;
    definition.allowedValues = std::move(allowedValues);
    return definition;
}

} // namespace

bool FieldSchemaRegistry::create(std::vector<FieldDefinition> mainDefinitions,
                                 std::vector<FieldDefinition> equipmentDefinitions,
                                 FieldSchemaRegistry& outRegistry,
                                 Error& outError) {
    outError.clear();
    if (!checkForm(mainDefinitions, FormKind::Main, outError) ||
        !checkForm(equipmentDefinitions, FormKind::Equipment, outError)) {
        return false;
    }
    outRegistry.main_ = std::move(mainDefinitions);
    outRegistry.equipment_ = std::move(equipmentDefinitions);
    return true;
}

const FieldSchemaRegistry& FieldSchemaRegistry::builtin() {
    static const FieldSchemaRegistry registry = [] {
        using namespace field_ids;
        FieldSchemaRegistry r;
        r.main_ = {
            field(kProjectName, "项目名称", FieldType::Text, "_widget_1635777114903", true),
            field(kProjectNumber, "项目编号", FieldType::Text, "_widget_1635777114935", true),
            field(kDesignNumber, "深化设计编号", FieldType::Text, "_widget_1636359817201"),
            field(kClientName, "客户名称", FieldType::Text, "_widget_1635777114972"),
            field(kStation, "场站", FieldType::Text, "_widget_1635777114991"),
        };
        r.equipment_ = {
            field(kEquipmentId, "位号", FieldType::Text, "equipment_id"),
            field(kEquipmentName, "设备名称", FieldType::Text, "_widget_1635777115211", true),
            field(kBrand, "品牌", FieldType::Text, "_widget_1635777115248"),
            field(kSpecModel, "规格型号", FieldType::Text, "_widget_1635777115287"),
            field(kTechParams, "技术参数", FieldType::Text, "_widget_1641439264111"),
            field(kQuantity, "数量", FieldType::Number, "_widget_1635777485580"),
            field(kUnit, "单位", FieldType::Text, "_widget_1654703913698"),
            field(kSubsystem, "子系统", FieldType::Text, "_widget_1636353456514"),
            field(kRemark, "备注", FieldType::Text, "_widget_1635777854826"),
            field(kTechRemark, "技术备注", FieldType::Text, "_widget_1666709244379"),
            field(kContractStatus, "合同内外", FieldType::Text, "_widget_1684760244471"),
            field(kSignalType, "信号类型", FieldType::Enum, "signal_type", false, {"DI", "DO", "AI", "AO"}),
            field(kDiCount, "DI点数", FieldType::Number, "di_count"),
            field(kDoCount, "DO点数", FieldType::Number, "do_count"),
            field(kAiCount, "AI点数", FieldType::Number, "ai_count"),
            field(kAoCount, "AO点数", FieldType::Number, "ao_count"),
            field(kRangeLow, "量程低限", FieldType::Number, "range_low"),
            field(kRangeHigh, "量程高限", FieldType::Number, "range_high"),
            field(kAlarmLevels, "报警等级", FieldType::Text, "alarm_levels"),
            field(kMaintenance, "维护使能", FieldType::Enum, "maintenance", false, {"是", "否", "yes", "no"}),
        };
        return r;
    }();
    return registry;
}

const std::vector<FieldDefinition>& FieldSchemaRegistry::definitions(FormKind form) const noexcept {
    return (form == FormKind::Main) ? main_ : equipment_;
}

const FieldDefinition* FieldSchemaRegistry::find(FormKind form, const std::string& fieldId) const {
    const auto& defs = definitions(form);
    const auto it = std::find_if(defs.begin(), defs.end(),
                                 [&](const FieldDefinition& definition) { return definition.id == fieldId; });
    return (it == defs.end()) ? nullptr : &(*it);
}

bool FieldSchemaRegistry::interpret(const RawPayload& payload,
                                    FormKind form,
                                    TypedRecord& outRecord,
                                    Error& outError) const {
    outError.clear();
    TypedRecord record;

    for (const auto& definition : definitions(form)) {
        const auto it = payload.find(definition.rawKey);
        if (it == payload.end() || isAbsent(it->second)) {
            if (definition.required) {
                outError = makeError(ErrorKind::SchemaMismatch, definition.id,
                                     "required field '" + definition.displayName + "' (key " +
                                         definition.rawKey + ") is missing");
                return false;
            }
            continue;
        }

        TypedValue value;
        std::string reason;
        if (!coerce(definition, it->second, value, reason)) {
            outError = makeError(ErrorKind::SchemaMismatch, definition.id,
                                 "field '" + definition.displayName + "': " + reason);
            return false;
        }
        record.set(definition.id, std::move(value));
    }

    outRecord = std::move(record);
    return true;
}

} // namespace ioc
