/**
 * @file table_generator.cpp
 * @brief iochannel source file.
 */

#include "iochannel/tables/table_generator.hpp"

#include <sstream>
#include <utility>

#include "iochannel/calc/address_format.hpp"

namespace ioc {
namespace {

std::string formatNumber(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

bool isRangeSource(const std::string& source) {
    return source == column_sources::kRangeLow || source == column_sources::kRangeHigh;
}

void addAddressFields(std::unordered_map<std::string, std::string>& fields,
                      DataType dataType,
                      std::int64_t address) {
    fields[column_sources::kAddress] = std::to_string(address);
    fields[column_sources::kPlcAddress] = formatPlcAddress(dataType, address);
    fields[column_sources::kCommAddress] = std::to_string(hostCommAddress(dataType, address));
    fields[column_sources::kDataType] = toString(dataType);
}

void addItemFields(std::unordered_map<std::string, std::string>& fields, const ChannelAssignment& assignment) {
    const auto& item = *assignment.source;
    fields[column_sources::kItemId] = item.id;
    fields[column_sources::kItemName] = item.name;
    fields[column_sources::kStation] = item.location;
    fields[column_sources::kSignalClass] = toString(assignment.signalClass);
    fields[column_sources::kReadWrite] = "R/W";
    fields[column_sources::kSaveHistory] = "是";
    if (item.range && !isDiscrete(assignment.signalClass)) {
        fields[column_sources::kRangeLow] = formatNumber(item.range->low);
        fields[column_sources::kRangeHigh] = formatNumber(item.range->high);
    }
}

} // namespace

bool TableGenerator::generate(const std::vector<ChannelAssignment>& assignments,
                              const TableTemplate& tableTemplate,
                              GeneratedTable& outTable,
                              Error& outError,
                              const ProgressSink& progress) const {
    outError.clear();

    if (tableTemplate.kind != kind()) {
        outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name,
                             std::string("template is for ") + toString(tableTemplate.kind) + " tables, not " +
                                 toString(kind()));
        return false;
    }
    if (!validateTemplate(tableTemplate, outError)) {
        return false;
    }

    std::vector<RowFields> sourceRows;
    if (!collectRows(assignments, sourceRows, outError)) {
        return false;
    }

    GeneratedTable table;
    table.kind = kind();
    table.templateName = tableTemplate.name;
    for (const auto& spec : tableTemplate.columns) {
        table.columns.push_back(spec.header);
    }

    const auto total = sourceRows.size();
    table.rows.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        auto& fields = sourceRows[i];
        fields[column_sources::kIndex] = std::to_string(i + 1);

        std::vector<std::string> row;
        row.reserve(tableTemplate.columns.size());
        for (const auto& spec : tableTemplate.columns) {
            std::string value;
            if (!spec.source.empty() && spec.source.front() == '=') {
                value = spec.source.substr(1);
            } else if (!spec.source.empty()) {
                const auto it = fields.find(spec.source);
                if (it != fields.end()) {
                    value = it->second;
                }
            }

            if (value.empty() && spec.mandatory) {
                const auto& tag = fields[column_sources::kTag];
                if (isRangeSource(spec.source)) {
                    outError = makeError(ErrorKind::MissingEngineeringRange, fields[column_sources::kItemId],
                                         "column '" + spec.header + "' requires an engineering range for " + tag);
                } else {
                    outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name,
                                         "mandatory column '" + spec.header + "' has no value for " + tag);
                }
                return false;
            }
            if (value.empty()) {
                value = spec.placeholder;
            }
            row.push_back(std::move(value));
        }
        table.rows.push_back(std::move(row));

        if (progress) {
            progress(i + 1, total);
        }
    }

    outTable = std::move(table);
    return true;
}

TableGenerator::RowFields TableGenerator::describeAssignment(const ChannelAssignment& assignment) {
    RowFields fields;
    fields[column_sources::kTag] = assignment.tag;
    addAddressFields(fields, assignment.dataType, assignment.address);
    addItemFields(fields, assignment);
    fields[column_sources::kModuleType] = assignment.moduleType;
    fields[column_sources::kModuleId] = assignment.moduleType + "#" + std::to_string(assignment.moduleInstance);
    fields[column_sources::kModuleInstance] = std::to_string(assignment.moduleInstance);
    fields[column_sources::kChannel] = std::to_string(assignment.channelIndex);
    fields[column_sources::kChannelCode] = assignment.channelCode;
    fields[column_sources::kRack] = std::to_string(assignment.rack);
    fields[column_sources::kSlot] = std::to_string(assignment.slot);
    if (assignment.source->reserved) {
        fields[column_sources::kComment] = "预留点位" + assignment.channelCode;
    } else {
        fields[column_sources::kComment] = assignment.source->name;
    }
    fields[column_sources::kDescription] = fields[column_sources::kComment];

    for (const auto& point : assignment.extensions) {
        const auto prefix = point.suffix.substr(1) + ".";
        fields[prefix + "tag"] = point.tag;
        fields[prefix + "plcAddress"] = formatPlcAddress(point.dataType, point.address);
        fields[prefix + "commAddress"] = std::to_string(hostCommAddress(point.dataType, point.address));
    }
    return fields;
}

TableGenerator::RowFields TableGenerator::describeExtension(const ChannelAssignment& assignment,
                                                           const ExtensionPoint& point) {
    RowFields fields;
    fields[column_sources::kTag] = point.tag;
    addAddressFields(fields, point.dataType, point.address);
    addItemFields(fields, assignment);
    fields[column_sources::kChannelCode] = assignment.channelCode;
    fields[column_sources::kComment] = assignment.source->name + " " + point.label;
    fields[column_sources::kDescription] = assignment.source->name + "_" + point.label;
    return fields;
}

} // namespace ioc
