/**
 * @file fat_table_generator.hpp
 * @brief iochannel source file.
 */

#pragma once

#include "iochannel/tables/table_generator.hpp"

namespace ioc {

/**
 * @brief Factory acceptance test table: every channel in allocation order with its PLC
 * and HMI data side by side, extension points as columns of their parent row.
 */
class FatTableGenerator final : public TableGenerator {
public:
    TableKind kind() const noexcept override { return TableKind::Fat; }

protected:
    bool collectRows(const std::vector<ChannelAssignment>& assignments,
                     std::vector<RowFields>& outRows,
                     Error& outError) const override;
};

} // namespace ioc
