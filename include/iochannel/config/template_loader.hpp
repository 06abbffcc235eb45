/**
 * @file template_loader.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>

#include "iochannel/core/error.hpp"
#include "iochannel/tables/table_template.hpp"

namespace ioc {

/**
 * @brief Loads a table template from an XML-like file:
 *
 * `<Template name="plc-site" kind="plc"/>` followed by columns in output order,
 * `<Column header="变量名" source="tag" mandatory="true" placeholder="/"/>`.
 * A source starting with '=' is a literal cell value.
 */
class TemplateLoader {
public:
    /**
     * @param outError `ConfigIo` for unreadable files, `InvalidTemplate` otherwise.
     */
    static bool loadFromXmlFile(const std::string& path, TableTemplate& outTemplate, Error& outError);
    static bool loadFromXmlString(const std::string& xml, TableTemplate& outTemplate, Error& outError);
};

} // namespace ioc
