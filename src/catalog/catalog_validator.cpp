/**
 * @file catalog_validator.cpp
 * @brief iochannel source file.
 */

#include "iochannel/catalog/catalog_validator.hpp"

#include <sstream>
#include <string>
#include <unordered_map>

namespace ioc {
namespace {

struct AddressRange {
    std::int64_t first = 0;
    std::int64_t last = 0;
};

// Ranges end at the last unit occupied by the last channel.
AddressRange instanceZeroRange(const ChannelModel& model) {
    return {model.baseAddress, model.addressOf(0, model.capacity - 1) + addressWidth(model.dataType()) - 1};
}

AddressRange fullRange(const ChannelModel& model) {
    return {model.baseAddress,
            model.addressOf(model.maxInstances - 1, model.capacity - 1) + addressWidth(model.dataType()) - 1};
}

bool overlaps(const AddressRange& a, const AddressRange& b) {
    return a.first <= b.last && b.first <= a.last;
}

std::string describe(const AddressRange& range) {
    std::ostringstream os;
    os << "[" << range.first << ".." << range.last << "]";
    return os.str();
}

bool modelShapeValid(const ChannelModel& model) {
    return model.capacity > 0 && model.channelStride > 0 && model.instanceStride > 0 &&
           model.maxInstances >= 0;
}

} // namespace

std::vector<ValidationIssue> CatalogValidator::validate(const ChannelModelCatalog::Definition& definition) {
    std::vector<ValidationIssue> issues;

    if (definition.models.empty()) {
        issues.push_back({ValidationSeverity::Error, "Catalog must declare at least one module type"});
    }

    std::unordered_map<std::string, std::size_t> moduleTypes;
    for (const auto& model : definition.models) {
        if (model.moduleType.empty()) {
            issues.push_back({ValidationSeverity::Error, "Module type identifier cannot be empty"});
            continue;
        }

        const auto [_, inserted] = moduleTypes.emplace(model.moduleType, 1U);
        if (!inserted) {
            issues.push_back({ValidationSeverity::Error,
                              "Duplicate module type: " + model.moduleType});
        }

        if (model.capacity <= 0) {
            issues.push_back({ValidationSeverity::Error,
                              "Module '" + model.moduleType + "' capacity must be a positive integer"});
        }
        if (model.channelStride <= 0 || model.instanceStride <= 0) {
            issues.push_back({ValidationSeverity::Error,
                              "Module '" + model.moduleType + "' strides must be positive integers"});
        }
        if (model.maxInstances < 0) {
            issues.push_back({ValidationSeverity::Error,
                              "Module '" + model.moduleType + "' maxInstances cannot be negative"});
        }
        if (model.baseAddress < 0) {
            issues.push_back({ValidationSeverity::Error,
                              "Module '" + model.moduleType + "' baseAddress cannot be negative"});
        }
        if (model.channelStride > 0 && model.channelStride < addressWidth(model.dataType())) {
            issues.push_back({ValidationSeverity::Error,
                              "Module '" + model.moduleType + "' channelStride " +
                                  std::to_string(model.channelStride) + " is narrower than one " +
                                  toString(model.dataType()) + " point"});
        }
        if (modelShapeValid(model) && model.instanceStride < model.capacity * model.channelStride) {
            std::ostringstream os;
            os << "Module '" << model.moduleType << "' instanceStride " << model.instanceStride
               << " is smaller than capacity * channelStride " << model.capacity * model.channelStride;
            issues.push_back({ValidationSeverity::Error, os.str()});
        }
    }

    for (std::size_t i = 0; i < definition.models.size(); ++i) {
        const auto& a = definition.models[i];
        if (!modelShapeValid(a)) {
            continue;
        }
        for (std::size_t j = i + 1; j < definition.models.size(); ++j) {
            const auto& b = definition.models[j];
            if (!modelShapeValid(b)) {
                continue;
            }

            if (a.signalClass == b.signalClass && overlaps(instanceZeroRange(a), instanceZeroRange(b))) {
                issues.push_back({ValidationSeverity::Error,
                                  "Modules '" + a.moduleType + "' " + describe(instanceZeroRange(a)) +
                                      " and '" + b.moduleType + "' " + describe(instanceZeroRange(b)) +
                                      " overlap at instance 0 for class " + toString(a.signalClass)});
                continue;
            }

            if (a.dataType() == b.dataType() && a.bounded() && b.bounded() &&
                overlaps(fullRange(a), fullRange(b))) {
                issues.push_back({ValidationSeverity::Error,
                                  "Modules '" + a.moduleType + "' " + describe(fullRange(a)) +
                                      " and '" + b.moduleType + "' " + describe(fullRange(b)) +
                                      " overlap in the " + toString(a.dataType()) + " address area"});
            }
        }
    }

    for (const auto signalClass : kAllocationOrder) {
        bool served = false;
        for (const auto& model : definition.models) {
            served = served || model.signalClass == signalClass;
        }
        if (!served) {
            issues.push_back({ValidationSeverity::Warning,
                              std::string("No module type serves signal class ") + toString(signalClass)});
        }
    }

    std::unordered_map<int, std::size_t> areasPerType;
    for (const auto& area : definition.extensionAreas) {
        if (area.stride <= 0 || area.baseAddress < 0) {
            issues.push_back({ValidationSeverity::Error,
                              std::string("Extension area for ") + toString(area.dataType) +
                                  " needs a non-negative base and a positive stride"});
        } else if (area.stride < addressWidth(area.dataType)) {
            issues.push_back({ValidationSeverity::Error,
                              std::string("Extension area for ") + toString(area.dataType) +
                                  " stride is narrower than one point"});
        }
        if (++areasPerType[static_cast<int>(area.dataType)] > 1U) {
            issues.push_back({ValidationSeverity::Error,
                              std::string("Duplicate extension area for ") + toString(area.dataType)});
        }
    }

    if (definition.rackLayout.slotsPerRack <= 0 || definition.rackLayout.firstSlot < 0) {
        issues.push_back({ValidationSeverity::Error,
                          "Rack layout needs slotsPerRack > 0 and firstSlot >= 0"});
    }

    return issues;
}

bool CatalogValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace ioc
