/**
 * @file hmi_table_generator.cpp
 * @brief iochannel source file.
 */

#include "iochannel/tables/hmi_table_generator.hpp"

#include <utility>

namespace ioc {
namespace {

using RowFieldMap = std::unordered_map<std::string, std::string>;

// Discrete HMI items carry a leading zero in front of the coil address.
void finishBoolRow(RowFieldMap& fields, std::int64_t tagId, const std::string& discreteType) {
    fields[column_sources::kTagId] = std::to_string(tagId);
    fields[column_sources::kHmiItem] = "0" + fields[column_sources::kCommAddress];
    fields[column_sources::kDiscreteType] = discreteType;
}

void finishRealRow(RowFieldMap& fields, std::int64_t tagId) {
    fields[column_sources::kTagId] = std::to_string(tagId);
    fields[column_sources::kHmiItem] = fields[column_sources::kCommAddress];
}

const char* discreteTypeOf(const ExtensionPoint& point) {
    return (point.kind == ExtensionKind::MaintenanceEnable) ? "MAIN_EN" : "ALARM";
}

} // namespace

std::int64_t HmiBoolTableGenerator::nextTagId(const std::vector<ChannelAssignment>& assignments) const {
    std::int64_t rows = 0;
    for (const auto& assignment : assignments) {
        if (isDiscrete(assignment.signalClass)) {
            ++rows;
        }
        for (const auto& point : assignment.extensions) {
            if (point.dataType == DataType::Bool) {
                ++rows;
            }
        }
    }
    return firstTagId_ + rows;
}

bool HmiBoolTableGenerator::collectRows(const std::vector<ChannelAssignment>& assignments,
                                        std::vector<RowFields>& outRows,
                                        Error& outError) const {
    std::vector<RowFields> rows;
    std::int64_t tagId = firstTagId_;

    for (const auto& assignment : assignments) {
        if (!isDiscrete(assignment.signalClass)) {
            continue;
        }
        auto fields = describeAssignment(assignment);
        finishBoolRow(fields, tagId++, toString(assignment.signalClass));
        rows.push_back(std::move(fields));
    }

    if (rows.empty()) {
        outError = makeError(ErrorKind::EmptyAssignmentSet, toString(kind()),
                             "no DI/DO channel assignments to export");
        return false;
    }

    for (const auto& assignment : assignments) {
        for (const auto& point : assignment.extensions) {
            if (point.dataType != DataType::Bool) {
                continue;
            }
            auto fields = describeExtension(assignment, point);
            finishBoolRow(fields, tagId++, discreteTypeOf(point));
            rows.push_back(std::move(fields));
        }
    }

    outRows = std::move(rows);
    return true;
}

bool HmiRealTableGenerator::collectRows(const std::vector<ChannelAssignment>& assignments,
                                        std::vector<RowFields>& outRows,
                                        Error& outError) const {
    std::vector<RowFields> rows;
    std::int64_t tagId = firstTagId_;

    for (const auto& assignment : assignments) {
        if (isDiscrete(assignment.signalClass)) {
            continue;
        }
        auto fields = describeAssignment(assignment);
        finishRealRow(fields, tagId++);
        rows.push_back(std::move(fields));
    }

    if (rows.empty()) {
        outError = makeError(ErrorKind::EmptyAssignmentSet, toString(kind()),
                             "no AI/AO channel assignments to export");
        return false;
    }

    for (const auto& assignment : assignments) {
        for (const auto& point : assignment.extensions) {
            if (point.dataType != DataType::Real) {
                continue;
            }
            auto fields = describeExtension(assignment, point);
            finishRealRow(fields, tagId++);
            rows.push_back(std::move(fields));
        }
    }

    outRows = std::move(rows);
    return true;
}

} // namespace ioc
