/**
 * @file channel_model_catalog.cpp
 * @brief iochannel source file.
 */

#include "iochannel/catalog/channel_model_catalog.hpp"

#include <algorithm>
#include <utility>

#include "iochannel/catalog/catalog_validator.hpp"

namespace ioc {
namespace {

ChannelModel model(const char* moduleType, SignalClass signalClass, std::int64_t capacity,
                   std::int64_t baseAddress, std::int64_t channelStride, std::int64_t maxInstances) {
    ChannelModel m;
    m.moduleType = moduleType;
    m.signalClass = signalClass;
    m.capacity = capacity;
    m.baseAddress = baseAddress;
    m.channelStride = channelStride;
    m.instanceStride = capacity * channelStride;
    m.maxInstances = maxInstances;
    return m;
}

} // namespace

bool ChannelModelCatalog::create(Definition definition, ChannelModelCatalog& outCatalog, Error& outError) {
    outError.clear();

    const auto issues = CatalogValidator::validate(definition);
    if (CatalogValidator::hasErrors(issues)) {
        std::string message = "Catalog validation failed:";
        for (const auto& issue : issues) {
            if (issue.severity == ValidationSeverity::Error) {
                message += " " + issue.message + ";";
            }
        }
        outError = makeError(ErrorKind::InvalidModuleModel, definition.version, message);
        return false;
    }

    outCatalog.definition_ = std::move(definition);
    return true;
}

const ChannelModelCatalog& ChannelModelCatalog::builtin() {
    static const ChannelModelCatalog catalog = [] {
        ChannelModelCatalog c;
        c.definition_.version = "lk-default-1";
        // REAL: %MD100 onwards, 4 bytes per channel. BOOL: %MX20.0 onwards, 1 bit per channel.
        c.definition_.models = {
            model("LK411", SignalClass::AnalogInput, 8, 100, 4, 20),
            model("LK512", SignalClass::AnalogOutput, 8, 800, 4, 20),
            model("LK610", SignalClass::DiscreteInput, 16, 160, 1, 20),
            model("LK710", SignalClass::DiscreteOutput, 16, 480, 1, 20),
        };
        c.definition_.rackLayout = RackLayout{};
        c.definition_.extensionAreas = {
            {DataType::Real, 2000, 4},
            {DataType::Bool, 3200, 1},
        };
        return c;
    }();
    return catalog;
}

const ChannelModel* ChannelModelCatalog::lookup(const std::string& moduleType, Error& outError) const {
    const auto& all = definition_.models;
    const auto it = std::find_if(all.begin(), all.end(),
                                 [&](const ChannelModel& m) { return m.moduleType == moduleType; });
    if (it == all.end()) {
        outError = makeError(ErrorKind::UnknownModuleType, moduleType,
                             "module type is not registered in catalog " + definition_.version);
        return nullptr;
    }
    return &(*it);
}

std::vector<const ChannelModel*> ChannelModelCatalog::modelsFor(SignalClass signalClass) const {
    std::vector<const ChannelModel*> selected;
    for (const auto& m : definition_.models) {
        if (m.signalClass == signalClass) {
            selected.push_back(&m);
        }
    }
    std::stable_sort(selected.begin(), selected.end(),
                     [](const ChannelModel* a, const ChannelModel* b) { return a->priority < b->priority; });
    return selected;
}

const ChannelModel* ChannelModelCatalog::matchSpecModel(const std::string& specModelText) const {
    if (specModelText.empty()) {
        return nullptr;
    }
    for (const auto& m : definition_.models) {
        if (specModelText.find(m.moduleType) != std::string::npos) {
            return &m;
        }
    }
    return nullptr;
}

const ExtensionArea* ChannelModelCatalog::extensionArea(DataType dataType) const {
    for (const auto& area : definition_.extensionAreas) {
        if (area.dataType == dataType) {
            return &area;
        }
    }
    return nullptr;
}

} // namespace ioc
