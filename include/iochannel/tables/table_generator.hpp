/**
 * @file table_generator.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "iochannel/calc/channel_calculator.hpp"
#include "iochannel/core/error.hpp"
#include "iochannel/tables/table_template.hpp"

namespace ioc {

/**
 * @brief Receives `(completed, total)` after every produced row.
 *
 * Called synchronously on the generating thread; generation does not wait on it
 * beyond the call itself.
 */
using ProgressSink = std::function<void(std::size_t completed, std::size_t total)>;

/**
 * @brief Base class of the point-table generators.
 *
 * A generator is a pure projection of an assignment sequence: derived classes pick and
 * order the rows (`collectRows`), the base class validates the template, projects every
 * row through its columns and reports progress.
 */
class TableGenerator {
public:
    virtual ~TableGenerator() = default;

    virtual TableKind kind() const noexcept = 0;

    /**
     * @brief Produce one table from `assignments` laid out by `tableTemplate`.
     *
     * Errors: `InvalidTemplate` (wrong kind, unknown source, empty mandatory cell),
     * `EmptyAssignmentSet` (nothing matches the generator's signal classes),
     * `MissingEngineeringRange` (mandatory range column without item range).
     * `outTable` is only written on success.
     */
    bool generate(const std::vector<ChannelAssignment>& assignments,
                  const TableTemplate& tableTemplate,
                  GeneratedTable& outTable,
                  Error& outError,
                  const ProgressSink& progress = {}) const;

protected:
    using RowFields = std::unordered_map<std::string, std::string>;

    /**
     * @brief Build the ordered source rows for `assignments`.
     */
    virtual bool collectRows(const std::vector<ChannelAssignment>& assignments,
                             std::vector<RowFields>& outRows,
                             Error& outError) const = 0;

    /// Fields of a main channel row.
    static RowFields describeAssignment(const ChannelAssignment& assignment);
    /// Fields of an extension point row derived from its parent channel.
    static RowFields describeExtension(const ChannelAssignment& assignment, const ExtensionPoint& point);
};

} // namespace ioc
