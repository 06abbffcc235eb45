/**
 * @file plc_table_generator.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>
#include <vector>

#include "iochannel/tables/table_generator.hpp"

namespace ioc {

/**
 * @brief PLC variable table: one row per channel followed by its extension points.
 */
class PlcTableGenerator final : public TableGenerator {
public:
    PlcTableGenerator() = default;
    /**
     * @brief Restrict the table to module types wired to the PLC target; an empty list
     * keeps every module type.
     */
    explicit PlcTableGenerator(std::vector<std::string> plcModuleTypes);

    TableKind kind() const noexcept override { return TableKind::Plc; }

protected:
    bool collectRows(const std::vector<ChannelAssignment>& assignments,
                     std::vector<RowFields>& outRows,
                     Error& outError) const override;

private:
    bool targetsPlc(const ChannelAssignment& assignment) const;

    std::vector<std::string> moduleTypes_;
};

} // namespace ioc
