#include "iochannel/tables/fat_table_generator.hpp"

#include <utility>

namespace ioc {

bool FatTableGenerator::collectRows(const std::vector<ChannelAssignment>& assignments,
                                    std::vector<RowFields>& outRows,
                                    Error& outError) const {
    if (assignments.empty()) {
        outError = makeError(ErrorKind::EmptyAssignmentSet, toString(kind()), "no channel assignments to export");
        return false;
    }

    std::vector<RowFields> rows;
    rows.reserve(assignments.size());
    for (const auto& assignment : assignments) {
        rows.push_back(describeAssignment(assignment));
    }
    outRows = std::move(rows);
    return true;
}

} // namespace ioc
