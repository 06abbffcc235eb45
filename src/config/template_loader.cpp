/**
 * @file template_loader.cpp
 * @brief iochannel source file.
 */

#include "iochannel/config/template_loader.hpp"

#include <stdexcept>
#include <utility>

#include "iochannel/config/text_extract.hpp"

namespace ioc {

bool TemplateLoader::loadFromXmlFile(const std::string& path, TableTemplate& outTemplate, Error& outError) {
    outError.clear();

    std::string xml;
    std::string ioError;
    if (!text::readFile(path, xml, ioError)) {
        outError = makeError(ErrorKind::ConfigIo, path, ioError);
        return false;
    }
    return loadFromXmlString(xml, outTemplate, outError);
}

bool TemplateLoader::loadFromXmlString(const std::string& xml, TableTemplate& outTemplate, Error& outError) {
    outError.clear();

    const auto headers = text::extractTags(xml, "Template");
    if (headers.empty()) {
        outError = makeError(ErrorKind::InvalidTemplate, "", "Missing <Template name=\"...\" kind=\"...\"/>");
        return false;
    }

    TableTemplate tableTemplate;
    tableTemplate.name = text::attr(headers.front(), "name").value_or("");
    const auto kindText = text::attr(headers.front(), "kind");
    const auto kind = kindText ? parseTableKind(*kindText) : std::nullopt;
    if (tableTemplate.name.empty() || !kind) {
        outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name,
                             "<Template> needs a name and a kind of plc, hmi-bool, hmi-real or fat");
        return false;
    }
    tableTemplate.kind = *kind;

    try {
        for (const auto& tag : text::extractTags(xml, "Column")) {
            ColumnSpec spec;
            spec.header = text::attr(tag, "header").value_or("");
            spec.source = text::attr(tag, "source").value_or("");
            spec.placeholder = text::attr(tag, "placeholder").value_or("");
            if (const auto mandatory = text::attr(tag, "mandatory")) {
                spec.mandatory = text::parseBool(*mandatory);
            }
            tableTemplate.columns.push_back(std::move(spec));
        }
    } catch (const std::exception& ex) {
        outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name,
                             std::string("Template parse error: ") + ex.what());
        return false;
    }

    if (!validateTemplate(tableTemplate, outError)) {
        return false;
    }
    outTemplate = std::move(tableTemplate);
    return true;
}

} // namespace ioc
