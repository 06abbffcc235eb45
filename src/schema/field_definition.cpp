/**
 * @file field_definition.cpp
 * @brief iochannel source file.
 */

#include "iochannel/schema/field_definition.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace ioc {
namespace {

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

void TypedRecord::set(const std::string& fieldId, TypedValue value) {
    values_[fieldId] = std::move(value);
}

bool TypedRecord::has(const std::string& fieldId) const {
    return values_.find(fieldId) != values_.end();
}

std::optional<std::string> TypedRecord::text(const std::string& fieldId) const {
    const auto it = values_.find(fieldId);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second.text;
}

std::optional<double> TypedRecord::number(const std::string& fieldId) const {
    const auto it = values_.find(fieldId);
    if (it == values_.end() || it->second.type != FieldType::Number) {
        return std::nullopt;
    }
    return it->second.number;
}

std::string TypedRecord::textOr(const std::string& fieldId, const std::string& fallback) const {
    const auto value = text(fieldId);
    return value ? *value : fallback;
}

const char* toString(FormKind form) {
    switch (form) {
    case FormKind::Main:
        return "main";
    case FormKind::Equipment:
        return "equipment";
    }
    return "unknown";
}

const char* toString(FieldType type) {
    switch (type) {
    case FieldType::Text:
        return "text";
    case FieldType::Number:
        return "number";
    case FieldType::Enum:
        return "enum";
    }
    return "unknown";
}

std::optional<FormKind> parseFormKind(const std::string& text) {
    const auto normalized = lowerCopy(text);
    if (normalized == "main") {
        return FormKind::Main;
    }
    if (normalized == "equipment") {
        return FormKind::Equipment;
    }
    return std::nullopt;
}

std::optional<FieldType> parseFieldType(const std::string& text) {
    const auto normalized = lowerCopy(text);
    if (normalized == "text") {
        return FieldType::Text;
    }
    if (normalized == "number") {
        return FieldType::Number;
    }
    if (normalized == "enum") {
        return FieldType::Enum;
    }
    return std::nullopt;
}

} // namespace ioc
