/**
 * @file text_extract.hpp
 * @brief Lightweight attribute/entry extraction shared by the configuration loaders.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ioc::text {

/// Read a whole file; on failure `outError` names the path.
bool readFile(const std::string& path, std::string& out, std::string& outError);

/// Value of `key="..."` inside one XML-like tag.
std::optional<std::string> attr(const std::string& xml, const std::string& key);

/// Every opening/self-closing `<tagName ...>` tag in document order.
std::vector<std::string> extractTags(const std::string& xml, const std::string& tagName);

/// Every flat `{ ... }` object (no nesting) in document order.
std::vector<std::string> extractJsonObjects(const std::string& json);

/// Value of `"key": "..."` or `"key": literal` inside one flat JSON object.
std::optional<std::string> jsonValue(const std::string& object, const std::string& key);

/// Decimal or 0x-prefixed integer consuming the whole text. Throws std::invalid_argument.
std::int64_t parseInteger(const std::string& value);

/// "true"/"1"/"yes" or "false"/"0"/"no" (case-insensitive). Throws std::invalid_argument.
bool parseBool(const std::string& value);

} // namespace ioc::text
