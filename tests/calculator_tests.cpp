/**
 * @file calculator_tests.cpp
 * @brief iochannel source file.
 */

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "iochannel/calc/address_format.hpp"
#include "iochannel/calc/calculation_cache.hpp"
#include "iochannel/calc/channel_calculator.hpp"

namespace {

ioc::EquipmentItem item(const std::string& id, std::map<ioc::SignalClass, double> requirements) {
    ioc::EquipmentItem result;
    result.id = id;
    result.name = id + " device";
    result.location = "Station A";
    result.requirements = std::move(requirements);
    return result;
}

ioc::ChannelModelCatalog makeCatalog(ioc::ChannelModelCatalog::Definition definition) {
    ioc::ChannelModelCatalog catalog;
    ioc::Error error;
    const bool ok = ioc::ChannelModelCatalog::create(std::move(definition), catalog, error);
    assert(ok);
    (void)ok;
    return catalog;
}

ioc::ChannelModel analogModel(const char* type, ioc::SignalClass signalClass, std::int64_t base,
                              std::int64_t capacity, int priority, std::int64_t maxInstances) {
    return {.moduleType = type,
            .signalClass = signalClass,
            .capacity = capacity,
            .baseAddress = base,
            .channelStride = 4,
            .instanceStride = capacity * 4,
            .priority = priority,
            .maxInstances = maxInstances};
}

void testAddressFormatting() {
    assert(ioc::formatPlcAddress(ioc::DataType::Bool, 160) == "%MX20.0");
    assert(ioc::formatPlcAddress(ioc::DataType::Bool, 3205) == "%MX400.5");
    assert(ioc::formatPlcAddress(ioc::DataType::Real, 104) == "%MD104");
    assert(ioc::hostCommAddress(ioc::DataType::Bool, 160) == 3161);
    assert(ioc::hostCommAddress(ioc::DataType::Real, 104) == 43053);
}

void testAllocationOrderAndLayout() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    const std::vector<ioc::EquipmentItem> items = {
        item("A", {{ioc::SignalClass::DiscreteInput, 2}, {ioc::SignalClass::AnalogInput, 1}}),
        item("B", {{ioc::SignalClass::AnalogInput, 1}, {ioc::SignalClass::DiscreteOutput, 1}}),
    };

    ioc::CalculationResult result;
    ioc::Error error;
    assert(ioc::ChannelCalculator::calculate(items, catalog, {}, result, error));
    assert(error.ok());
    assert(result.assignments.size() == 5);
    assert(result.moduleCount == 3);
    assert(result.rackCount == 1);
    assert(result.warnings.empty());

    const auto& a0 = result.assignments[0];
    assert(a0.tag == "A_AI_0_0");
    assert(a0.moduleType == "LK411");
    assert(a0.address == 100);
    assert(a0.dataType == ioc::DataType::Real);
    assert(a0.rack == 1 && a0.slot == 2);
    assert(a0.channelCode == "1_2_AI_0");
    assert(a0.source->id == "A");

    const auto& b0 = result.assignments[1];
    assert(b0.tag == "B_AI_0_1");
    assert(b0.address == 104);
    assert(b0.itemIndex == 1);

    const auto& di = result.assignments[2];
    assert(di.tag == "A_DI_0_0");
    assert(di.address == 160);
    assert(di.slot == 3);
    assert(result.assignments[3].address == 161);

    const auto& dout = result.assignments[4];
    assert(dout.tag == "B_DO_0_0");
    assert(dout.address == 480);
    assert(dout.slot == 4);
    assert(dout.channelCode == "1_4_DO_0");
}

void testRolloverAndConservation() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    const std::vector<ioc::EquipmentItem> items = {
        item("FT", {{ioc::SignalClass::AnalogInput, 10}}),
        item("XV", {{ioc::SignalClass::DiscreteInput, 17}, {ioc::SignalClass::DiscreteOutput, 3}}),
    };

    ioc::CalculationResult result;
    ioc::Error error;
    assert(ioc::ChannelCalculator::calculate(items, catalog, {}, result, error));
    assert(result.assignments.size() == 30);
    assert(result.count(ioc::SignalClass::AnalogInput) == 10);
    assert(result.count(ioc::SignalClass::DiscreteInput) == 17);
    assert(result.count(ioc::SignalClass::DiscreteOutput) == 3);
    assert(result.count(ioc::SignalClass::AnalogOutput) == 0);

    const auto& ninth = result.assignments[8];
    assert(ninth.moduleInstance == 1);
    assert(ninth.channelIndex == 0);
    assert(ninth.address == 132);
    assert(ninth.tag == "FT_AI_1_0");

    std::set<std::pair<int, std::int64_t>> addresses;
    std::set<std::string> tags;
    for (const auto& assignment : result.assignments) {
        const auto* model = catalog.lookup(assignment.moduleType, error);
        assert(model != nullptr);
        assert(assignment.channelIndex >= 0 && assignment.channelIndex < model->capacity);
        assert(addresses.emplace(static_cast<int>(assignment.dataType), assignment.address).second);
        assert(tags.insert(assignment.tag).second);
    }

    ioc::CalculationResult again;
    assert(ioc::ChannelCalculator::calculate(items, catalog, {}, again, error));
    assert(again.assignments.size() == result.assignments.size());
    for (std::size_t i = 0; i < again.assignments.size(); ++i) {
        assert(again.assignments[i].tag == result.assignments[i].tag);
        assert(again.assignments[i].address == result.assignments[i].address);
        assert(again.assignments[i].moduleInstance == result.assignments[i].moduleInstance);
    }
}

void testInvalidRequirementsAllocateNothing() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    ioc::CalculationResult result;
    result.warnings.push_back("untouched");
    ioc::Error error;

    const std::vector<ioc::EquipmentItem> negative = {
        item("OK", {{ioc::SignalClass::AnalogInput, 4}}),
        item("BAD", {{ioc::SignalClass::DiscreteInput, -1}}),
    };
    assert(!ioc::ChannelCalculator::calculate(negative, catalog, {}, result, error));
    assert(error.kind == ioc::ErrorKind::InvalidRequirement);
    assert(error.subject == "BAD");
    assert(result.assignments.empty());
    assert(result.warnings.size() == 1);

    const std::vector<ioc::EquipmentItem> fractional = {item("HALF", {{ioc::SignalClass::AnalogOutput, 1.5}})};
    assert(!ioc::ChannelCalculator::calculate(fractional, catalog, {}, result, error));
    assert(error.kind == ioc::ErrorKind::InvalidRequirement);

    const std::vector<ioc::EquipmentItem> notANumber = {
        item("NAN", {{ioc::SignalClass::AnalogOutput, std::numeric_limits<double>::quiet_NaN()}})};
    assert(!ioc::ChannelCalculator::calculate(notANumber, catalog, {}, result, error));
    assert(error.kind == ioc::ErrorKind::InvalidRequirement);

    assert(ioc::ChannelCalculator::calculate(std::vector<ioc::EquipmentItem>{}, catalog, {}, result, error));
    assert(result.assignments.empty());
    assert(result.moduleCount == 0);
}

void testModelHandoffAndExhaustion() {
    const auto catalog = makeCatalog({.version = "handoff",
                                      .models = {
                                          analogModel("AI-SMALL", ioc::SignalClass::AnalogInput, 100, 4, 0, 1),
                                          analogModel("AI-LARGE", ioc::SignalClass::AnalogInput, 200, 8, 1, 2),
                                      }});

    ioc::CalculationResult result;
    ioc::Error error;
    assert(ioc::ChannelCalculator::calculate({item("TT", {{ioc::SignalClass::AnalogInput, 6}})}, catalog, {},
                                             result, error));
    assert(result.assignments.size() == 6);
    assert(result.assignments[3].moduleType == "AI-SMALL");
    assert(result.assignments[3].address == 112);
    assert(result.assignments[4].moduleType == "AI-LARGE");
    assert(result.assignments[4].moduleInstance == 0);
    assert(result.assignments[4].address == 200);
    assert(result.assignments[4].tag == "TT_AI_1_0");
    assert(result.moduleCount == 2);

    assert(!ioc::ChannelCalculator::calculate({item("TT", {{ioc::SignalClass::AnalogInput, 21}})}, catalog, {},
                                              result, error));
    assert(error.kind == ioc::ErrorKind::CapacityExhausted);
    assert(error.subject == "TT");

    assert(!ioc::ChannelCalculator::calculate({item("LS", {{ioc::SignalClass::DiscreteInput, 1}})}, catalog, {},
                                              result, error));
    assert(error.kind == ioc::ErrorKind::UnknownModuleType);
    assert(error.subject == "DI");
}

void testAddressConflict() {
    // Unbounded models are only range-checked at instance 0, so AI instance 1 lands on AO instance 0.
    const auto catalog = makeCatalog({.version = "conflict",
                                      .models = {
                                          analogModel("AI-U", ioc::SignalClass::AnalogInput, 100, 8, 0, 0),
                                          analogModel("AO-U", ioc::SignalClass::AnalogOutput, 132, 8, 0, 0),
                                      }});

    ioc::CalculationResult result;
    ioc::Error error;
    assert(!ioc::ChannelCalculator::calculate(
        {item("FV", {{ioc::SignalClass::AnalogInput, 9}, {ioc::SignalClass::AnalogOutput, 1}})}, catalog, {},
        result, error));
    assert(error.kind == ioc::ErrorKind::AddressConflict);
    assert(error.subject == "FV_AO_0_0");
    assert(result.assignments.empty());
}

void testRealWordsMayNotOverlap() {
    // AO-W starts two bytes into the first word of the second AI module.
    const auto catalog = makeCatalog({.version = "words",
                                      .models = {
                                          analogModel("AI-W", ioc::SignalClass::AnalogInput, 100, 8, 0, 0),
                                          analogModel("AO-W", ioc::SignalClass::AnalogOutput, 134, 8, 0, 0),
                                      }});

    ioc::CalculationResult result;
    ioc::Error error;
    assert(!ioc::ChannelCalculator::calculate(
        {item("FV", {{ioc::SignalClass::AnalogInput, 9}, {ioc::SignalClass::AnalogOutput, 1}})}, catalog, {},
        result, error));
    assert(error.kind == ioc::ErrorKind::AddressConflict);
    assert(error.subject == "FV_AO_0_0");

    // With a single AI module the last AI word ends at byte 131.
    assert(ioc::ChannelCalculator::calculate(
        {item("FV", {{ioc::SignalClass::AnalogInput, 8}, {ioc::SignalClass::AnalogOutput, 1}})}, catalog, {},
        result, error));
    assert(result.assignments.back().address == 134);
}

void testReservedChannels() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    auto spare = item("EQ002", {{ioc::SignalClass::AnalogInput, 8}});
    spare.reserved = true;
    const std::vector<ioc::EquipmentItem> items = {item("PT", {{ioc::SignalClass::AnalogInput, 1}}), spare};

    ioc::CalculationResult result;
    ioc::Error error;
    assert(ioc::ChannelCalculator::calculate(items, catalog, {}, result, error));
    assert(result.assignments.size() == 9);
    assert(result.assignments[0].tag == "PT_AI_0_0");
    assert(result.assignments[1].tag == "YLDW1_2_AI_1");
    assert(result.assignments[8].tag == "YLDW1_3_AI_0");
    assert(result.assignments[8].moduleInstance == 1);
    assert(result.assignments[8].source->reserved);
}

void testRackWarning() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    const std::vector<ioc::EquipmentItem> items = {item("TE", {{ioc::SignalClass::AnalogInput, 88}})};

    ioc::CalculationResult result;
    ioc::Error error;
    assert(ioc::ChannelCalculator::calculate(items, catalog, {.rackCount = 1}, result, error));
    assert(result.moduleCount == 11);
    assert(result.rackCount == 2);
    assert(result.warnings.size() == 1);
    assert(result.warnings[0].find("LK117") != std::string::npos);
    assert(result.assignments[80].rack == 2);
    assert(result.assignments[80].slot == 2);

    ioc::ProjectInput input;
    input.items = items;
    input.rackCount = 2;
    assert(ioc::ChannelCalculator::calculate(input, catalog, result, error));
    assert(result.warnings.empty());
}

void testExtensionPoints() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    auto transmitter = item("PT", {{ioc::SignalClass::AnalogInput, 2}, {ioc::SignalClass::DiscreteInput, 1}});
    transmitter.alarmLevels = {ioc::AlarmLevel::LowLow, ioc::AlarmLevel::High};
    transmitter.maintenance = true;

    ioc::CalculationResult result;
    ioc::Error error;
    assert(ioc::ChannelCalculator::calculate({transmitter}, catalog, {}, result, error));
    assert(result.assignments.size() == 3);

    const auto& first = result.assignments[0].extensions;
    assert(first.size() == 6);
    assert(first[0].tag == "PT_AI_0_0_LoLoLimit");
    assert(first[0].dataType == ioc::DataType::Real);
    assert(first[0].address == 2000);
    assert(first[1].suffix == "_HiLimit");
    assert(first[1].address == 2004);
    assert(first[2].tag == "PT_AI_0_0_LL");
    assert(first[2].kind == ioc::ExtensionKind::Alarm);
    assert(first[2].address == 3200);
    assert(first[3].level == ioc::AlarmLevel::High);
    assert(first[4].kind == ioc::ExtensionKind::MaintenanceValue);
    assert(first[4].address == 2008);
    assert(first[5].tag == "PT_AI_0_0_MAIN_EN");
    assert(first[5].address == 3202);
    assert(ioc::formatPlcAddress(first[5].dataType, first[5].address) == "%MX400.2");

    const auto& second = result.assignments[1].extensions;
    assert(second[0].address == 2012);
    assert(second[2].address == 3203);

    // Discrete channels never carry auxiliary points and keep their regular addresses.
    assert(result.assignments[2].extensions.empty());
    assert(result.assignments[2].address == 160);

    // Without an extension area the request cannot be served.
    const auto bare = makeCatalog({.version = "bare",
                                   .models = {analogModel("AI-X", ioc::SignalClass::AnalogInput, 100, 8, 0, 4)}});
    auto analogOnly = transmitter;
    analogOnly.requirements.erase(ioc::SignalClass::DiscreteInput);
    assert(!ioc::ChannelCalculator::calculate({analogOnly}, bare, {}, result, error));
    assert(error.kind == ioc::ErrorKind::CapacityExhausted);
}

void testCache() {
    const auto& catalog = ioc::ChannelModelCatalog::builtin();
    const std::vector<ioc::EquipmentItem> items = {item("LT", {{ioc::SignalClass::AnalogInput, 3}})};

    ioc::CalculationCache cache(2);
    ioc::CalculationResult first;
    ioc::CalculationResult second;
    ioc::Error error;
    assert(cache.calculate(items, catalog, {}, first, error));
    assert(cache.calculate(items, catalog, {}, second, error));
    assert(cache.hits() == 1);
    assert(cache.misses() == 1);
    assert(cache.size() == 1);
    assert(second.assignments.size() == first.assignments.size());
    assert(second.assignments[2].tag == first.assignments[2].tag);

    const auto other = makeCatalog({.version = "lk-variant",
                                    .models = catalog.models(),
                                    .rackLayout = catalog.rackLayout(),
                                    .extensionAreas = catalog.extensionAreas()});
    assert(ioc::CalculationCache::fingerprint(items, catalog, {}) !=
           ioc::CalculationCache::fingerprint(items, other, {}));
    assert(ioc::CalculationCache::fingerprint(items, catalog, {.rackCount = 1}) !=
           ioc::CalculationCache::fingerprint(items, catalog, {.rackCount = 3}));

    const std::vector<ioc::EquipmentItem> bad = {item("LT", {{ioc::SignalClass::AnalogInput, -3}})};
    assert(!cache.calculate(bad, catalog, {}, first, error));
    assert(error.kind == ioc::ErrorKind::InvalidRequirement);
    assert(cache.size() == 1);

    assert(cache.calculate(items, other, {}, first, error));
    assert(cache.calculate(items, catalog, {.rackCount = 2}, first, error));
    assert(cache.size() == 2);

    cache.clear();
    assert(cache.size() == 0);
    assert(cache.hits() == 0);
}

void testCacheSeparatesCatalogsWithoutVersion() {
    const auto first = makeCatalog(
        {.models = {analogModel("AI-A", ioc::SignalClass::AnalogInput, 100, 8, 0, 4)}});
    const auto second = makeCatalog(
        {.models = {analogModel("AI-B", ioc::SignalClass::AnalogInput, 900, 8, 0, 4)}});
    assert(first.version() == second.version());

    const std::vector<ioc::EquipmentItem> items = {item("LT", {{ioc::SignalClass::AnalogInput, 1}})};
    assert(ioc::CalculationCache::fingerprint(items, first, {}) !=
           ioc::CalculationCache::fingerprint(items, second, {}));

    ioc::CalculationCache cache;
    ioc::CalculationResult result;
    ioc::Error error;
    assert(cache.calculate(items, first, {}, result, error));
    assert(result.assignments[0].address == 100);
    assert(cache.calculate(items, second, {}, result, error));
    assert(result.assignments[0].moduleType == "AI-B");
    assert(result.assignments[0].address == 900);
    assert(cache.hits() == 0);
    assert(cache.size() == 2);

    auto shifted = second.extensionAreas();
    shifted.push_back({ioc::DataType::Real, 2000, 4});
    const auto withArea = makeCatalog({.models = second.models(), .extensionAreas = shifted});
    assert(ioc::CalculationCache::fingerprint(items, second, {}) !=
           ioc::CalculationCache::fingerprint(items, withArea, {}));
}

} // namespace

int main() {
    testAddressFormatting();
    testAllocationOrderAndLayout();
    testRolloverAndConservation();
    testInvalidRequirementsAllocateNothing();
    testModelHandoffAndExhaustion();
    testAddressConflict();
    testRealWordsMayNotOverlap();
    testReservedChannels();
    testRackWarning();
    testExtensionPoints();
    testCache();
    testCacheSeparatesCatalogsWithoutVersion();
    std::cout << "calculator_tests passed\n";
    return 0;
}
