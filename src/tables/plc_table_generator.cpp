/**
 * @file plc_table_generator.cpp
 * @brief iochannel source file.
 */

#include "iochannel/tables/plc_table_generator.hpp"

#include <algorithm>
#include <utility>

namespace ioc {
namespace {

void addPlcDefaults(std::unordered_map<std::string, std::string>& fields, DataType dataType) {
    const bool real = dataType == DataType::Real;
    fields[column_sources::kInitialValue] = real ? "0" : "FALSE";
    fields[column_sources::kPowerProtect] = real ? "TRUE" : "FALSE";
    fields[column_sources::kForcible] = "TRUE";
    fields[column_sources::kSoeEnable] = "FALSE";
}

} // namespace

PlcTableGenerator::PlcTableGenerator(std::vector<std::string> plcModuleTypes)
    : moduleTypes_(std::move(plcModuleTypes)) {}

bool PlcTableGenerator::targetsPlc(const ChannelAssignment& assignment) const {
    return moduleTypes_.empty() ||
           std::find(moduleTypes_.begin(), moduleTypes_.end(), assignment.moduleType) != moduleTypes_.end();
}

bool PlcTableGenerator::collectRows(const std::vector<ChannelAssignment>& assignments,
                                    std::vector<RowFields>& outRows,
                                    Error& outError) const {
    std::vector<RowFields> rows;
    for (const auto& assignment : assignments) {
        if (!targetsPlc(assignment)) {
            continue;
        }
        auto fields = describeAssignment(assignment);
        addPlcDefaults(fields, assignment.dataType);
        rows.push_back(std::move(fields));

        for (const auto& point : assignment.extensions) {
            auto extension = describeExtension(assignment, point);
            addPlcDefaults(extension, point.dataType);
            rows.push_back(std::move(extension));
        }
    }

    if (rows.empty()) {
        outError = makeError(ErrorKind::EmptyAssignmentSet, toString(kind()),
                             "no channel assignment targets the PLC");
        return false;
    }
    outRows = std::move(rows);
    return true;
}

} // namespace ioc
