/**
 * @file loader_tests.cpp
 * @brief iochannel source file.
 */

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "iochannel/config/catalog_loader.hpp"
#include "iochannel/config/field_schema_loader.hpp"
#include "iochannel/config/template_loader.hpp"

namespace {

namespace fs = std::filesystem;

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

void testCatalogLoader(const fs::path& base) {
    const auto path = base / "catalog.xml";
    writeFile(path,
              "<Catalog version=\"site-7\">"
              "<Module type=\"LK411\" signalClass=\"AI\" capacity=\"8\" baseAddress=\"100\" channelStride=\"4\" maxInstances=\"10\"/>"
              "<Module type=\"LK610\" signalClass=\"di\" capacity=\"16\" baseAddress=\"0x40\" maxInstances=\"8\" priority=\"2\"/>"
              "<RackLayout model=\"LK117\" slotsPerRack=\"8\" firstSlot=\"1\"/>"
              "<ExtensionArea dataType=\"REAL\" baseAddress=\"2000\"/>"
              "<ExtensionArea dataType=\"BOOL\" baseAddress=\"3200\"/>"
              "</Catalog>");

    ioc::ChannelModelCatalog catalog;
    ioc::Error error;
    assert(ioc::CatalogLoader::loadFromXmlFile(path.string(), catalog, error));
    assert(error.ok());
    assert(catalog.version() == "site-7");
    assert(catalog.models().size() == 2);

    const auto* ai = catalog.lookup("LK411", error);
    assert(ai != nullptr);
    assert(ai->instanceStride == 32);
    assert(ai->maxInstances == 10);

    const auto* di = catalog.lookup("LK610", error);
    assert(di != nullptr);
    assert(di->signalClass == ioc::SignalClass::DiscreteInput);
    assert(di->baseAddress == 64);
    assert(di->priority == 2);

    assert(catalog.rackLayout().slotsPerRack == 8);
    assert(catalog.extensionArea(ioc::DataType::Real)->stride == 4);
    assert(catalog.extensionArea(ioc::DataType::Bool)->stride == 1);

    assert(!ioc::CatalogLoader::loadFromXmlFile((base / "missing.xml").string(), catalog, error));
    assert(error.kind == ioc::ErrorKind::ConfigIo);

    assert(!ioc::CatalogLoader::loadFromXmlString(
        "<Catalog version=\"bad\"><Module type=\"X\" signalClass=\"AI\" capacity=\"eight\" baseAddress=\"0\"/></Catalog>",
        catalog, error));
    assert(error.kind == ioc::ErrorKind::InvalidModuleModel);

    assert(!ioc::CatalogLoader::loadFromXmlString(
        "<Catalog version=\"dup\">"
        "<Module type=\"A\" signalClass=\"AI\" capacity=\"8\" baseAddress=\"0\"/>"
        "<Module type=\"A\" signalClass=\"AO\" capacity=\"8\" baseAddress=\"500\"/>"
        "</Catalog>",
        catalog, error));
    assert(error.kind == ioc::ErrorKind::InvalidModuleModel);
    assert(error.subject == "dup");
    assert(catalog.version() == "site-7");
}

void testFieldSchemaLoader(const fs::path& base) {
    const auto path = base / "field_schema.json";
    writeFile(path,
              "[\n"
              "  {\"form\": \"main\", \"id\": \"project_name\", \"name\": \"项目名称\", \"type\": \"text\", \"key\": \"p1\", \"required\": true},\n"
              "  {\"form\": \"equipment\", \"id\": \"equipment_name\", \"type\": \"text\", \"key\": \"e1\", \"required\": \"yes\"},\n"
              "  {\"form\": \"equipment\", \"id\": \"quantity\", \"type\": \"number\", \"key\": \"e2\"},\n"
              "  {\"form\": \"equipment\", \"id\": \"signal_type\", \"type\": \"enum\", \"key\": \"e3\", \"values\": \"DI|DO|AI|AO\"}\n"
              "]\n");

    ioc::FieldSchemaRegistry registry;
    ioc::Error error;
    assert(ioc::FieldSchemaLoader::loadFromJsonFile(path.string(), registry, error));
    assert(registry.definitions(ioc::FormKind::Main).size() == 1);
    assert(registry.definitions(ioc::FormKind::Equipment).size() == 3);

    const auto* projectName = registry.find(ioc::FormKind::Main, "project_name");
    assert(projectName != nullptr);
    assert(projectName->required);
    assert(projectName->displayName == "项目名称");

    const auto* signalType = registry.find(ioc::FormKind::Equipment, "signal_type");
    assert(signalType != nullptr);
    assert(signalType->type == ioc::FieldType::Enum);
    assert(signalType->allowedValues.size() == 4);

    ioc::TypedRecord record;
    assert(registry.interpret({{"e1", std::string("Pump")}, {"e2", std::string("4")}, {"e3", std::string("DO")}},
                              ioc::FormKind::Equipment, record, error));
    assert(record.number("quantity").value_or(0.0) == 4.0);

    assert(!ioc::FieldSchemaLoader::loadFromJsonString(
        "[{\"form\": \"sidebar\", \"id\": \"x\", \"type\": \"text\", \"key\": \"k\"}]", registry, error));
    assert(error.kind == ioc::ErrorKind::SchemaMismatch);
    assert(error.subject == "x");

    assert(!ioc::FieldSchemaLoader::loadFromJsonString(
        "[{\"form\": \"main\", \"id\": \"x\", \"type\": \"enum\", \"key\": \"k\"}]", registry, error));
    assert(error.kind == ioc::ErrorKind::SchemaMismatch);

    assert(!ioc::FieldSchemaLoader::loadFromJsonFile((base / "none.json").string(), registry, error));
    assert(error.kind == ioc::ErrorKind::ConfigIo);
}

void testTemplateLoader(const fs::path& base) {
    const auto path = base / "plc_template.xml";
    writeFile(path,
              "<Template name=\"plc-site\" kind=\"plc\">\n"
              "  <Column header=\"变量名\" source=\"tag\" mandatory=\"true\"/>\n"
              "  <Column header=\"直接地址\" source=\"plcAddress\" mandatory=\"true\"/>\n"
              "  <Column header=\"读写\" source=\"=R/W\"/>\n"
              "  <Column header=\"量程\" source=\"rangeLow\" placeholder=\"/\"/>\n"
              "</Template>\n");

    ioc::TableTemplate tableTemplate;
    ioc::Error error;
    assert(ioc::TemplateLoader::loadFromXmlFile(path.string(), tableTemplate, error));
    assert(tableTemplate.name == "plc-site");
    assert(tableTemplate.kind == ioc::TableKind::Plc);
    assert(tableTemplate.columns.size() == 4);
    assert(tableTemplate.columns[0].mandatory);
    assert(tableTemplate.columns[2].source == "=R/W");
    assert(tableTemplate.columns[3].placeholder == "/");

    assert(!ioc::TemplateLoader::loadFromXmlString(
        "<Template name=\"x\" kind=\"word\"><Column header=\"A\" source=\"tag\"/></Template>", tableTemplate, error));
    assert(error.kind == ioc::ErrorKind::InvalidTemplate);

    assert(!ioc::TemplateLoader::loadFromXmlString(
        "<Template name=\"x\" kind=\"fat\"><Column header=\"A\" source=\"rack_no\"/></Template>", tableTemplate,
        error));
    assert(error.kind == ioc::ErrorKind::InvalidTemplate);
    assert(tableTemplate.name == "plc-site");

    assert(!ioc::TemplateLoader::loadFromXmlFile((base / "none.xml").string(), tableTemplate, error));
    assert(error.kind == ioc::ErrorKind::ConfigIo);
}

} // namespace

int main() {
    const auto base = fs::temp_directory_path() / "ioc_loader_test";
    fs::create_directories(base);

    testCatalogLoader(base);
    testFieldSchemaLoader(base);
    testTemplateLoader(base);

    fs::remove_all(base);
    std::cout << "loader_tests passed\n";
    return 0;
}
