/**
 * @file point_table_demo.cpp
 * @brief iochannel source file.
 */

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "iochannel/calc/calculation_cache.hpp"
#include "iochannel/config/catalog_loader.hpp"
#include "iochannel/config/field_schema_loader.hpp"
#include "iochannel/config/template_loader.hpp"
#include "iochannel/schema/equipment_builder.hpp"
#include "iochannel/tables/fat_table_generator.hpp"
#include "iochannel/tables/hmi_table_generator.hpp"
#include "iochannel/tables/plc_table_generator.hpp"

namespace {

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (const char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void writeCsvRow(std::ofstream& out, const std::vector<std::string>& cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << csvField(cells[i]);
    }
    out << '\n';
}

bool writeCsv(const std::filesystem::path& path, const ioc::GeneratedTable& table) {
    std::ofstream out(path);
    if (!out) {
        return false;
    }
    writeCsvRow(out, table.columns);
    for (const auto& row : table.rows) {
        writeCsvRow(out, row);
    }
    return static_cast<bool>(out);
}

// Raw form entries as the intake side would submit them, keyed by widget keys.
ioc::RawPayload sampleMainPayload() {
    return {
        {"_widget_1635777114903", std::string("Demo gas station")},
        {"_widget_1635777114935", std::string("DEMO-001")},
        {"_widget_1635777114972", std::string("Demo client")},
        {"_widget_1635777114991", std::string("Station A")},
    };
}

std::vector<ioc::RawPayload> sampleEquipmentPayloads() {
    return {
        {{"equipment_id", std::string("PT-101")},
         {"_widget_1635777115211", std::string("Inlet pressure transmitter")},
         {"_widget_1635777485580", std::int64_t{2}},
         {"signal_type", std::string("AI")},
         {"range_low", std::int64_t{0}},
         {"range_high", 6.3},
         {"alarm_levels", std::string("L,H,HH")},
         {"maintenance", std::string("是")}},
        {{"equipment_id", std::string("TT-102")},
         {"_widget_1635777115211", std::string("Outlet temperature transmitter")},
         {"_widget_1635777485580", std::int64_t{1}},
         {"signal_type", std::string("AI")},
         {"range_low", std::int64_t{-40}},
         {"range_high", std::int64_t{120}}},
        {{"equipment_id", std::string("XV-201")},
         {"_widget_1635777115211", std::string("Emergency shutdown valve")},
         {"di_count", std::int64_t{2}},
         {"do_count", std::int64_t{1}}},
        {{"equipment_id", std::string("FCV-301")},
         {"_widget_1635777115211", std::string("Flow control valve")},
         {"ao_count", std::int64_t{1}},
         {"ai_count", std::int64_t{1}},
         {"range_low", std::int64_t{0}},
         {"range_high", std::int64_t{100}}},
        {{"_widget_1635777115211", std::string("PLC rack")},
         {"_widget_1635777115287", std::string("LK117 10-slot backplane")},
         {"_widget_1635777485580", std::int64_t{1}}},
    };
}

} // namespace

int main(int argc, char** argv) {
    const std::string catalogPath = (argc > 1) ? argv[1] : "";
    const std::string schemaPath = (argc > 2) ? argv[2] : "";
    const std::string plcTemplatePath = (argc > 3) ? argv[3] : "";

    std::filesystem::path outputDir = "point_tables";
    if (const char* env = std::getenv("IOC_OUTPUT_DIR")) {
        outputDir = env;
    }
    std::size_t progressEvery = 10;
    if (const char* env = std::getenv("IOC_PROGRESS_EVERY")) {
        try {
            const long parsed = std::stol(env);
            if (parsed > 0) {
                progressEvery = static_cast<std::size_t>(parsed);
            } else {
                std::cerr << "IOC_PROGRESS_EVERY must be positive, got " << parsed << '\n';
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid IOC_PROGRESS_EVERY value: '" << env << "'\n";
            return 1;
        }
    }

    ioc::Error error;

    ioc::ChannelModelCatalog catalog = ioc::ChannelModelCatalog::builtin();
    if (!catalogPath.empty() && !ioc::CatalogLoader::loadFromXmlFile(catalogPath, catalog, error)) {
        std::cerr << "Catalog load failed: " << error.describe() << '\n';
        return 1;
    }
    ioc::FieldSchemaRegistry registry = ioc::FieldSchemaRegistry::builtin();
    if (!schemaPath.empty() && !ioc::FieldSchemaLoader::loadFromJsonFile(schemaPath, registry, error)) {
        std::cerr << "Field schema load failed: " << error.describe() << '\n';
        return 1;
    }
    ioc::TableTemplate plcTemplate = ioc::BuiltinTemplates::plc();
    if (!plcTemplatePath.empty() && !ioc::TemplateLoader::loadFromXmlFile(plcTemplatePath, plcTemplate, error)) {
        std::cerr << "PLC template load failed: " << error.describe() << '\n';
        return 1;
    }
    std::cout << "Catalog " << catalog.version() << " with " << catalog.models().size() << " module types\n";

    ioc::ProjectInput input;
    if (!ioc::EquipmentItemBuilder::fromPayloads(registry, sampleMainPayload(), sampleEquipmentPayloads(), catalog,
                                                 input, error)) {
        std::cerr << "Form intake failed: " << error.describe() << '\n';
        return 1;
    }
    std::cout << "Project " << input.project.number << ": " << input.items.size() << " equipment items, "
              << input.rackCount << " rack(s) declared\n";

    ioc::CalculationCache cache;
    ioc::CalculationOptions options;
    options.rackCount = input.rackCount;
    ioc::CalculationResult result;
    if (!cache.calculate(input.items, catalog, options, result, error)) {
        std::cerr << "Channel calculation failed: " << error.describe() << '\n';
        return 1;
    }
    std::cout << "Allocated " << result.assignments.size() << " channels on " << result.moduleCount
              << " modules (AI=" << result.count(ioc::SignalClass::AnalogInput)
              << " AO=" << result.count(ioc::SignalClass::AnalogOutput)
              << " DI=" << result.count(ioc::SignalClass::DiscreteInput)
              << " DO=" << result.count(ioc::SignalClass::DiscreteOutput) << ")\n";
    for (const auto& warning : result.warnings) {
        std::cout << "Warning: " << warning << '\n';
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "Cannot create output directory " << outputDir << ": " << ec.message() << '\n';
        return 1;
    }

    struct Export {
        std::unique_ptr<ioc::TableGenerator> generator;
        ioc::TableTemplate tableTemplate;
        std::string fileName;
    };
    std::vector<Export> exports;
    exports.push_back({std::make_unique<ioc::PlcTableGenerator>(), plcTemplate, "plc_points.csv"});
    // Both HMI sheets belong to one project, so float TagIDs continue after the discrete ones.
    auto discreteHmi = std::make_unique<ioc::HmiBoolTableGenerator>();
    const auto firstFloatTagId = discreteHmi->nextTagId(result.assignments);
    exports.push_back({std::move(discreteHmi), ioc::BuiltinTemplates::hmiDisc(), "hmi_io_disc.csv"});
    exports.push_back({std::make_unique<ioc::HmiRealTableGenerator>(firstFloatTagId),
                       ioc::BuiltinTemplates::hmiFloat(), "hmi_io_float.csv"});
    exports.push_back({std::make_unique<ioc::FatTableGenerator>(), ioc::BuiltinTemplates::fat(), "fat_points.csv"});

    int failures = 0;
    for (const auto& item : exports) {
        const char* kindName = ioc::toString(item.generator->kind());
        ioc::GeneratedTable table;
        const bool generated = item.generator->generate(
            result.assignments, item.tableTemplate, table, error,
            [&](std::size_t completed, std::size_t total) {
                if (completed == total || (completed % progressEvery) == 0) {
                    std::cout << "[" << kindName << "] " << completed << "/" << total << " rows\n";
                }
            });
        if (!generated) {
            std::cerr << "Generating " << kindName << " table failed: " << error.describe() << '\n';
            ++failures;
            continue;
        }

        const auto path = outputDir / item.fileName;
        if (!writeCsv(path, table)) {
            std::cerr << "Cannot write " << path << '\n';
            ++failures;
            continue;
        }
        std::cout << "Wrote " << table.rows.size() << " rows to " << path << '\n';
    }

    return failures == 0 ? 0 : 1;
}
