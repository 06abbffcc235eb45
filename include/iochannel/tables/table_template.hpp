/**
 * @file table_template.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "iochannel/core/error.hpp"

namespace ioc {

/**
 * @brief Output table family; each is produced by one generator.
 */
enum class TableKind { Plc, HmiBool, HmiReal, Fat };

/**
 * @brief One output column.
 *
 * `source` names a derived row field (see `isKnownColumnSource`), or starts with '='
 * for a literal value, or is empty for a column that is always blank.
 */
struct ColumnSpec {
    std::string header;
    std::string source;
    /// An empty value in a mandatory column fails generation.
    bool mandatory = false;
    /// Written instead of an empty value, e.g. "/".
    std::string placeholder;
};

struct TableTemplate {
    std::string name;
    TableKind kind = TableKind::Plc;
    std::vector<ColumnSpec> columns;
};

/**
 * @brief Export-ready table: column headers plus ordered rows of cells.
 */
struct GeneratedTable {
    TableKind kind = TableKind::Plc;
    std::string templateName;
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
};

/**
 * @brief Derived row fields a template column may reference.
 */
namespace column_sources {
inline constexpr const char* kIndex = "index";
inline constexpr const char* kTag = "tag";
inline constexpr const char* kAddress = "address";
inline constexpr const char* kPlcAddress = "plcAddress";
inline constexpr const char* kCommAddress = "commAddress";
inline constexpr const char* kModuleType = "moduleType";
inline constexpr const char* kModuleId = "moduleId";
inline constexpr const char* kModuleInstance = "moduleInstance";
inline constexpr const char* kChannel = "channel";
inline constexpr const char* kChannelCode = "channelCode";
inline constexpr const char* kRack = "rack";
inline constexpr const char* kSlot = "slot";
inline constexpr const char* kSignalClass = "signalClass";
inline constexpr const char* kDataType = "dataType";
inline constexpr const char* kComment = "comment";
inline constexpr const char* kDescription = "description";
inline constexpr const char* kItemId = "itemId";
inline constexpr const char* kItemName = "itemName";
inline constexpr const char* kStation = "station";
inline constexpr const char* kRangeLow = "rangeLow";
inline constexpr const char* kRangeHigh = "rangeHigh";
inline constexpr const char* kReadWrite = "readWrite";
inline constexpr const char* kSaveHistory = "saveHistory";
inline constexpr const char* kInitialValue = "initialValue";
inline constexpr const char* kPowerProtect = "powerProtect";
inline constexpr const char* kForcible = "forcible";
inline constexpr const char* kSoeEnable = "soeEnable";
inline constexpr const char* kTagId = "tagId";
inline constexpr const char* kHmiItem = "hmiItem";
inline constexpr const char* kDiscreteType = "discreteType";
} // namespace column_sources

/**
 * @brief True for the names in `column_sources` and for per-extension fields
 * "<suffix>.tag", "<suffix>.plcAddress", "<suffix>.commAddress" where suffix is one of
 * LoLoLimit, LoLimit, HiLimit, HiHiLimit, LL, L, H, HH, whz, MAIN_EN.
 */
bool isKnownColumnSource(const std::string& source);

/**
 * @brief Check a template before use.
 * @return false with `ErrorKind::InvalidTemplate` on an empty template, an empty header
 * or an unknown column source.
 */
bool validateTemplate(const TableTemplate& tableTemplate, Error& outError);

/**
 * @brief Templates replicating the point-table layouts used on site.
 */
class BuiltinTemplates {
public:
    /// "plc": PLC variable table.
    static TableTemplate plc();
    /// "hmi-disc": HMI IO_DISC sheet.
    static TableTemplate hmiDisc();
    /// "hmi-float": HMI IO_FLOAT sheet.
    static TableTemplate hmiFloat();
    /// "fat": factory acceptance IO point table.
    static TableTemplate fat();

    /**
     * @brief Resolve a built-in template by name.
     * @return false with `ErrorKind::InvalidTemplate` for unknown names.
     */
    static bool byName(const std::string& name, TableTemplate& outTemplate, Error& outError);
};

const char* toString(TableKind kind);
std::optional<TableKind> parseTableKind(const std::string& text);

} // namespace ioc
