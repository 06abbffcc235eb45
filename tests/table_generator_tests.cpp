/**
 * @file table_generator_tests.cpp
 * @brief iochannel source file.
 */

#include <cassert>
#include <cstddef>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "iochannel/calc/channel_calculator.hpp"
#include "iochannel/tables/fat_table_generator.hpp"
#include "iochannel/tables/hmi_table_generator.hpp"
#include "iochannel/tables/plc_table_generator.hpp"

namespace {

std::vector<ioc::ChannelAssignment> calculate(const std::vector<ioc::EquipmentItem>& items) {
    ioc::CalculationResult result;
    ioc::Error error;
    const bool ok = ioc::ChannelCalculator::calculate(items, ioc::ChannelModelCatalog::builtin(), {}, result, error);
    assert(ok);
    (void)ok;
    return result.assignments;
}

ioc::EquipmentItem transmitter() {
    ioc::EquipmentItem item;
    item.id = "PT";
    item.name = "PT device";
    item.location = "Station A";
    item.requirements[ioc::SignalClass::AnalogInput] = 1;
    item.range = ioc::EngineeringRange{0.0, 10.0};
    item.alarmLevels = {ioc::AlarmLevel::High};
    return item;
}

ioc::EquipmentItem limitSwitch() {
    ioc::EquipmentItem item;
    item.id = "LS";
    item.name = "LS device";
    item.location = "Station A";
    item.requirements[ioc::SignalClass::DiscreteInput] = 2;
    return item;
}

std::size_t column(const ioc::GeneratedTable& table, const std::string& header) {
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (table.columns[i] == header) {
            return i;
        }
    }
    assert(false && "missing column");
    return 0;
}

const std::string& cell(const ioc::GeneratedTable& table, std::size_t row, const std::string& header) {
    return table.rows.at(row).at(column(table, header));
}

void testPlcTable() {
    const auto assignments = calculate({transmitter(), limitSwitch()});
    const ioc::PlcTableGenerator generator{};
    const auto plc = ioc::BuiltinTemplates::plc();

    ioc::GeneratedTable table;
    ioc::Error error;
    assert(generator.generate(assignments, plc, table, error));
    assert(error.ok());
    assert(table.kind == ioc::TableKind::Plc);
    assert(table.columns.size() == plc.columns.size());
    assert(table.rows.size() == 5);

    assert(cell(table, 0, "序号") == "1");
    assert(cell(table, 0, "模块") == "LK411#0");
    assert(cell(table, 0, "变量名") == "PT_AI_0_0");
    assert(cell(table, 0, "直接地址") == "%MD100");
    assert(cell(table, 0, "变量类型") == "REAL");
    assert(cell(table, 0, "初始值") == "0");
    assert(cell(table, 0, "掉电保护") == "TRUE");

    assert(cell(table, 1, "变量名") == "PT_AI_0_0_HiLimit");
    assert(cell(table, 1, "直接地址") == "%MD2000");
    assert(cell(table, 1, "变量说明") == "PT device SH设定点位");
    assert(cell(table, 2, "变量名") == "PT_AI_0_0_H");
    assert(cell(table, 2, "直接地址") == "%MX400.0");

    assert(cell(table, 3, "序号") == "4");
    assert(cell(table, 3, "变量名") == "LS_DI_0_0");
    assert(cell(table, 3, "直接地址") == "%MX20.0");
    assert(cell(table, 3, "初始值") == "FALSE");
    assert(cell(table, 4, "直接地址") == "%MX20.1");

    ioc::GeneratedTable again;
    assert(generator.generate(assignments, plc, again, error));
    assert(again.rows == table.rows);

    const ioc::PlcTableGenerator remoteOnly(std::vector<std::string>{"LK999"});
    ioc::GeneratedTable untouched;
    assert(!remoteOnly.generate(assignments, plc, untouched, error));
    assert(error.kind == ioc::ErrorKind::EmptyAssignmentSet);
    assert(untouched.rows.empty());

    const ioc::PlcTableGenerator discreteOnly(std::vector<std::string>{"LK610"});
    assert(discreteOnly.generate(assignments, plc, table, error));
    assert(table.rows.size() == 2);
}

void testHmiTables() {
    const auto assignments = calculate({transmitter(), limitSwitch()});

    ioc::GeneratedTable discrete;
    ioc::Error error;
    assert(ioc::HmiBoolTableGenerator().generate(assignments, ioc::BuiltinTemplates::hmiDisc(), discrete, error));
    assert(discrete.rows.size() == 3);
    assert(cell(discrete, 0, "TagID") == "1");
    assert(cell(discrete, 0, "TagName") == "LS_DI_0_0");
    assert(cell(discrete, 0, "ItemName") == "03161");
    assert(cell(discrete, 0, "SignalType") == "DI");
    assert(cell(discrete, 0, "TagDataType") == "IODisc");
    assert(cell(discrete, 1, "ItemName") == "03162");
    assert(cell(discrete, 2, "TagID") == "3");
    assert(cell(discrete, 2, "TagName") == "PT_AI_0_0_H");
    assert(cell(discrete, 2, "ItemName") == "06201");
    assert(cell(discrete, 2, "SignalType") == "ALARM");

    ioc::GeneratedTable analog;
    assert(ioc::HmiRealTableGenerator(100).generate(assignments, ioc::BuiltinTemplates::hmiFloat(), analog, error));
    assert(analog.rows.size() == 2);
    assert(cell(analog, 0, "TagID") == "100");
    assert(cell(analog, 0, "TagName") == "PT_AI_0_0");
    assert(cell(analog, 0, "ItemName") == "43051");
    assert(cell(analog, 0, "EngineeringLow") == "0");
    assert(cell(analog, 0, "EngineeringHigh") == "10");
    assert(cell(analog, 1, "TagID") == "101");
    assert(cell(analog, 1, "ItemName") == "44001");
    assert(cell(analog, 1, "Description") == "PT device_SH设定点位");

    // One HMI project: float TagIDs continue after the discrete sheet.
    const ioc::HmiBoolTableGenerator discreteGenerator;
    const auto firstFloatTagId = discreteGenerator.nextTagId(assignments);
    assert(firstFloatTagId == 4);
    assert(discreteGenerator.generate(assignments, ioc::BuiltinTemplates::hmiDisc(), discrete, error));
    assert(ioc::HmiRealTableGenerator(firstFloatTagId)
               .generate(assignments, ioc::BuiltinTemplates::hmiFloat(), analog, error));
    std::set<std::string> tagIds;
    for (std::size_t row = 0; row < discrete.rows.size(); ++row) {
        assert(tagIds.insert(cell(discrete, row, "TagID")).second);
    }
    for (std::size_t row = 0; row < analog.rows.size(); ++row) {
        assert(tagIds.insert(cell(analog, row, "TagID")).second);
    }
    assert(tagIds.size() == 5);
    assert(cell(analog, 0, "TagID") == "4");

    const auto discreteOnly = calculate({limitSwitch()});
    assert(!ioc::HmiRealTableGenerator().generate(discreteOnly, ioc::BuiltinTemplates::hmiFloat(), analog, error));
    assert(error.kind == ioc::ErrorKind::EmptyAssignmentSet);

    const auto analogOnly = calculate({transmitter()});
    assert(!ioc::HmiBoolTableGenerator().generate(analogOnly, ioc::BuiltinTemplates::hmiDisc(), discrete, error));
    assert(error.kind == ioc::ErrorKind::EmptyAssignmentSet);
}

void testMandatoryColumns() {
    auto unranged = transmitter();
    unranged.id = "FT";
    unranged.range.reset();
    const auto assignments = calculate({unranged});

    auto strict = ioc::BuiltinTemplates::hmiFloat();
    for (auto& spec : strict.columns) {
        if (spec.source == ioc::column_sources::kRangeLow || spec.source == ioc::column_sources::kRangeHigh) {
            spec.mandatory = true;
        }
    }

    ioc::GeneratedTable table;
    ioc::Error error;
    assert(!ioc::HmiRealTableGenerator().generate(assignments, strict, table, error));
    assert(error.kind == ioc::ErrorKind::MissingEngineeringRange);
    assert(error.subject == "FT");

    // Optional range columns are left blank instead.
    assert(ioc::HmiRealTableGenerator().generate(assignments, ioc::BuiltinTemplates::hmiFloat(), table, error));
    assert(cell(table, 0, "EngineeringLow").empty());

    // Extension rows have no module, so a mandatory module column cannot be satisfied.
    auto plc = ioc::BuiltinTemplates::plc();
    plc.columns[1].mandatory = true;
    assert(!ioc::PlcTableGenerator().generate(assignments, plc, table, error));
    assert(error.kind == ioc::ErrorKind::InvalidTemplate);
}

void testFatTable() {
    const auto assignments = calculate({transmitter(), limitSwitch()});
    const auto fat = ioc::BuiltinTemplates::fat();

    ioc::GeneratedTable table;
    ioc::Error error;
    assert(ioc::FatTableGenerator().generate(assignments, fat, table, error));
    assert(table.rows.size() == assignments.size());

    assert(cell(table, 0, "模块类型") == "AI");
    assert(cell(table, 0, "位号") == "PT");
    assert(cell(table, 0, "量程低限") == "0");
    assert(cell(table, 0, "SH设定点位") == "PT_AI_0_0_HiLimit");
    assert(cell(table, 0, "SH设定点位_通讯地址") == "44001");
    assert(cell(table, 0, "H报警_PLC地址") == "%MX400.0");
    assert(cell(table, 0, "SLL设定点位").empty());
    assert(cell(table, 0, "SH设定值") == "/");

    assert(cell(table, 1, "通道位号") == "1_3_DI_0");
    assert(cell(table, 1, "量程低限") == "/");
    assert(cell(table, 1, "供电类型（有源/无源）") == "/");
    assert(cell(table, 1, "掉电保护") == "是");
    assert(cell(table, 1, "PLC绝对地址") == "%MX20.0");
    assert(cell(table, 1, "上位机通讯地址") == "3161");

    assert(!ioc::FatTableGenerator().generate({}, fat, table, error));
    assert(error.kind == ioc::ErrorKind::EmptyAssignmentSet);
}

void testReservedRows() {
    auto spare = limitSwitch();
    spare.id = "EQ003";
    spare.name = "LK610 card";
    spare.reserved = true;
    const auto assignments = calculate({transmitter(), spare});

    ioc::GeneratedTable plc;
    ioc::Error error;
    assert(ioc::PlcTableGenerator().generate(assignments, ioc::BuiltinTemplates::plc(), plc, error));
    assert(cell(plc, 3, "变量名") == "YLDW1_3_DI_0");
    assert(cell(plc, 3, "变量说明") == "预留点位1_3_DI_0");
    assert(cell(plc, 0, "变量说明") == "PT device");

    ioc::GeneratedTable fat;
    assert(ioc::FatTableGenerator().generate(assignments, ioc::BuiltinTemplates::fat(), fat, error));
    assert(cell(fat, 2, "变量名称（HMI）") == "YLDW1_3_DI_1");
    assert(cell(fat, 2, "变量描述") == "预留点位1_3_DI_1");
    assert(cell(fat, 2, "模块名称") == "LK610 card");
}

void testTemplateChecks() {
    const auto assignments = calculate({limitSwitch()});
    ioc::GeneratedTable table;
    ioc::Error error;

    assert(!ioc::PlcTableGenerator().generate(assignments, ioc::BuiltinTemplates::fat(), table, error));
    assert(error.kind == ioc::ErrorKind::InvalidTemplate);

    auto typo = ioc::BuiltinTemplates::plc();
    typo.columns.push_back({.header = "Extra", .source = "plcAdress"});
    assert(!ioc::PlcTableGenerator().generate(assignments, typo, table, error));
    assert(error.kind == ioc::ErrorKind::InvalidTemplate);

    assert(ioc::isKnownColumnSource("HH.commAddress"));
    assert(ioc::isKnownColumnSource("=R/W"));
    assert(!ioc::isKnownColumnSource("HH.range"));

    ioc::TableTemplate named;
    assert(ioc::BuiltinTemplates::byName("hmi-disc", named, error));
    assert(named.kind == ioc::TableKind::HmiBool);
    assert(!ioc::BuiltinTemplates::byName("excel", named, error));
}

void testProgressAndPolymorphism() {
    const auto assignments = calculate({transmitter(), limitSwitch()});

    std::vector<std::unique_ptr<ioc::TableGenerator>> generators;
    generators.push_back(std::make_unique<ioc::PlcTableGenerator>());
    generators.push_back(std::make_unique<ioc::HmiBoolTableGenerator>());
    generators.push_back(std::make_unique<ioc::HmiRealTableGenerator>());
    generators.push_back(std::make_unique<ioc::FatTableGenerator>());
    const std::vector<ioc::TableTemplate> templates = {
        ioc::BuiltinTemplates::plc(),
        ioc::BuiltinTemplates::hmiDisc(),
        ioc::BuiltinTemplates::hmiFloat(),
        ioc::BuiltinTemplates::fat(),
    };

    for (std::size_t i = 0; i < generators.size(); ++i) {
        std::size_t calls = 0;
        std::size_t lastCompleted = 0;
        std::size_t lastTotal = 0;
        ioc::GeneratedTable table;
        ioc::Error error;
        assert(generators[i]->kind() == templates[i].kind);
        assert(generators[i]->generate(assignments, templates[i], table, error,
                                       [&](std::size_t completed, std::size_t total) {
                                           ++calls;
                                           lastCompleted = completed;
                                           lastTotal = total;
                                       }));
        assert(calls == table.rows.size());
        assert(lastCompleted == lastTotal);
        assert(lastTotal == table.rows.size());
    }
}

} // namespace

int main() {
    testPlcTable();
    testHmiTables();
    testMandatoryColumns();
    testFatTable();
    testReservedRows();
    testTemplateChecks();
    testProgressAndPolymorphism();
    std::cout << "table_generator_tests passed\n";
    return 0;
}
