/**
 * @file hmi_table_generator.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstdint>

#include "iochannel/tables/table_generator.hpp"

namespace ioc {

/**
 * @brief HMI discrete tag sheet: DI/DO channels, then the alarm and maintenance-enable
 * bits of analog channels.
 *
 * Tag ids count up from `firstTagId`; the HMI item name is "0" followed by the host
 * communication (coil) address.
 */
class HmiBoolTableGenerator final : public TableGenerator {
public:
    explicit HmiBoolTableGenerator(std::int64_t firstTagId = 1) : firstTagId_(firstTagId) {}

    TableKind kind() const noexcept override { return TableKind::HmiBool; }

    /// TagID following the last row this generator emits for `assignments`; the IO_FLOAT
    /// sheet of the same HMI project starts there.
    std::int64_t nextTagId(const std::vector<ChannelAssignment>& assignments) const;

protected:
    bool collectRows(const std::vector<ChannelAssignment>& assignments,
                     std::vector<RowFields>& outRows,
                     Error& outError) const override;

private:
    std::int64_t firstTagId_;
};

/**
 * @brief HMI analog tag sheet: AI/AO channels, then the set-point and maintenance-value
 * points of analog channels.
 *
 * Engineering range columns are filled from the source item when it has a range and
 * left blank otherwise, unless the template marks them mandatory. Tag ids usually
 * continue after the last discrete tag id.
 */
class HmiRealTableGenerator final : public TableGenerator {
public:
    explicit HmiRealTableGenerator(std::int64_t firstTagId = 1) : firstTagId_(firstTagId) {}

    TableKind kind() const noexcept override { return TableKind::HmiReal; }

protected:
    bool collectRows(const std::vector<ChannelAssignment>& assignments,
                     std::vector<RowFields>& outRows,
                     Error& outError) const override;

private:
    std::int64_t firstTagId_;
};

} // namespace ioc
