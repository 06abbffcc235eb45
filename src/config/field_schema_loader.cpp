/**
 * @file field_schema_loader.cpp
 * @brief iochannel source file.
 */

#include "iochannel/config/field_schema_loader.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "iochannel/config/text_extract.hpp"

namespace ioc {
namespace {

std::vector<std::string> splitValues(const std::string& values) {
    std::vector<std::string> out;
    std::stringstream stream(values);
    std::string token;
    while (std::getline(stream, token, '|')) {
        if (!token.empty()) {
            out.push_back(token);
        }
    }
    return out;
}

} // namespace

bool FieldSchemaLoader::loadFromJsonFile(const std::string& path, FieldSchemaRegistry& outRegistry, Error& outError) {
    outError.clear();

    std::string json;
    std::string ioError;
    if (!text::readFile(path, json, ioError)) {
        outError = makeError(ErrorKind::ConfigIo, path, ioError);
        return false;
    }
    return loadFromJsonString(json, outRegistry, outError);
}

bool FieldSchemaLoader::loadFromJsonString(const std::string& json, FieldSchemaRegistry& outRegistry, Error& outError) {
    outError.clear();

    std::vector<FieldDefinition> mainDefinitions;
    std::vector<FieldDefinition> equipmentDefinitions;

    try {
        for (const auto& object : text::extractJsonObjects(json)) {
            const auto form = text::jsonValue(object, "form");
            const auto id = text::jsonValue(object, "id");
            const auto type = text::jsonValue(object, "type");
            const auto key = text::jsonValue(object, "key");
            if (!form || !id || !type || !key) {
                outError = makeError(ErrorKind::SchemaMismatch, id.value_or(""),
                                     "field entry needs form, id, type and key: " + object);
                return false;
            }

            const auto parsedForm = parseFormKind(*form);
            if (!parsedForm) {
                outError = makeError(ErrorKind::SchemaMismatch, *id, "unknown form '" + *form + "'");
                return false;
            }
            const auto parsedType = parseFieldType(*type);
            if (!parsedType) {
                outError = makeError(ErrorKind::SchemaMismatch, *id, "unknown field type '" + *type + "'");
                return false;
            }

            FieldDefinition definition;
            definition.id = *id;
            definition.displayName = text::jsonValue(object, "name").value_or(*id);
            definition.type = *parsedType;
            definition.rawKey = *key;
            if (const auto required = text::jsonValue(object, "required")) {
                definition.required = text::parseBool(*required);
            }
            if (const auto values = text::jsonValue(object, "values")) {
                definition.allowedValues = splitValues(*values);
            }

            auto& target = (*parsedForm == FormKind::Main) ? mainDefinitions : equipmentDefinitions;
            target.push_back(std::move(definition));
        }
    } catch (const std::exception& ex) {
        outError = makeError(ErrorKind::SchemaMismatch, "", std::string("Field schema parse error: ") + ex.what());
        return false;
    }

    if (mainDefinitions.empty() && equipmentDefinitions.empty()) {
        outError = makeError(ErrorKind::SchemaMismatch, "", "No field definitions found");
        return false;
    }

    return FieldSchemaRegistry::create(std::move(mainDefinitions), std::move(equipmentDefinitions), outRegistry,
                                       outError);
}

} // namespace ioc
