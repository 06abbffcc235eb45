/**
 * @file field_definition.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ioc {

/**
 * @brief Form a raw payload belongs to.
 */
enum class FormKind { Main, Equipment };

/**
 * @brief Semantic type a raw value is coerced to.
 */
enum class FieldType { Text, Number, Enum };

/**
 * @brief Immutable descriptor binding a stable field identifier to a raw payload key.
 */
struct FieldDefinition {
    /// Stable identifier used by the engine, e.g. "quantity".
    std::string id;
    /// Display name shown to users, e.g. "数量".
    std::string displayName;
    FieldType type = FieldType::Text;
    /// Key in the raw payload, e.g. "_widget_1635777485580".
    std::string rawKey;
    /// Missing required fields fail interpretation.
    bool required = false;
    /// Accepted values for `FieldType::Enum`.
    std::vector<std::string> allowedValues;
};

/// Primitive value as delivered by the data service. `std::monostate` is null.
using RawValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using RawPayload = std::unordered_map<std::string, RawValue>;

/**
 * @brief Value after coercion to a field's semantic type.
 */
struct TypedValue {
    FieldType type = FieldType::Text;
    /// Text and enum values; the canonical spelling for numbers.
    std::string text;
    double number = 0.0;
};

/**
 * @brief Interpreted record keyed by field identifier.
 */
class TypedRecord {
public:
    void set(const std::string& fieldId, TypedValue value);
    bool has(const std::string& fieldId) const;

    std::optional<std::string> text(const std::string& fieldId) const;
    std::optional<double> number(const std::string& fieldId) const;

    std::string textOr(const std::string& fieldId, const std::string& fallback) const;

    const std::unordered_map<std::string, TypedValue>& values() const noexcept { return values_; }

private:
    std::unordered_map<std::string, TypedValue> values_;
};

const char* toString(FormKind form);
const char* toString(FieldType type);
std::optional<FormKind> parseFormKind(const std::string& text);
std::optional<FieldType> parseFieldType(const std::string& text);

} // namespace ioc
