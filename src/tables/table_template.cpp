/**
 * @file table_template.cpp
 * @brief iochannel source file.
 */

#include "iochannel/tables/table_template.hpp"

#include <array>
#include <utility>

namespace ioc {
namespace {

constexpr std::array<const char*, 30> kPlainSources = {
    column_sources::kIndex,        column_sources::kTag,          column_sources::kAddress,
    column_sources::kPlcAddress,   column_sources::kCommAddress,  column_sources::kModuleType,
    column_sources::kModuleId,     column_sources::kModuleInstance, column_sources::kChannel,
    column_sources::kChannelCode,  column_sources::kRack,         column_sources::kSlot,
    column_sources::kSignalClass,  column_sources::kDataType,     column_sources::kComment,
    column_sources::kDescription,  column_sources::kItemId,       column_sources::kItemName,
    column_sources::kStation,      column_sources::kRangeLow,     column_sources::kRangeHigh,
    column_sources::kReadWrite,    column_sources::kSaveHistory,  column_sources::kInitialValue,
    column_sources::kPowerProtect, column_sources::kForcible,     column_sources::kSoeEnable,
    column_sources::kTagId,        column_sources::kHmiItem,      column_sources::kDiscreteType,
};

constexpr std::array<const char*, 10> kExtensionNames = {
    "LoLoLimit", "LoLimit", "HiLimit", "HiHiLimit", "LL", "L", "H", "HH", "whz", "MAIN_EN",
};

constexpr std::array<const char*, 3> kExtensionFields = {"tag", "plcAddress", "commAddress"};

ColumnSpec column(const char* header, std::string source, bool mandatory = false, const char* placeholder = "") {
    ColumnSpec spec;
    spec.header = header;
    spec.source = std::move(source);
    spec.mandatory = mandatory;
    spec.placeholder = placeholder;
    return spec;
}

ColumnSpec literal(const char* header, const char* value) {
    return column(header, std::string("=") + value);
}

// HMI columns shared by the IO_DISC and IO_FLOAT sheets, in sheet order.
void appendHmiChannelColumns(std::vector<ColumnSpec>& columns) {
    columns.push_back(literal("ChannelName", "Network1"));
    columns.push_back(literal("ChannelDriver", "ModbusMaster"));
    columns.push_back(literal("DeviceSeries", "ModbusTCP"));
    columns.push_back(literal("DeviceSeriesType", "0"));
    columns.push_back(literal("CollectControl", "否"));
    columns.push_back(literal("CollectInterval", "1000"));
    columns.push_back(literal("CollectOffset", "0"));
    columns.push_back(literal("TimeZoneBias", "0"));
    columns.push_back(literal("TimeAdjustment", "0"));
    columns.push_back(literal("Enable", "是"));
    columns.push_back(literal("ForceWrite", "否"));
    columns.push_back(column("ItemName", column_sources::kHmiItem, true));
}

void appendHmiHistoryColumns(std::vector<ColumnSpec>& columns) {
    columns.push_back(literal("ItemAccessMode", "读写"));
    columns.push_back(literal("HisRecordMode", "不记录"));
    columns.push_back(literal("HisDeadBand", "0.000000"));
    columns.push_back(literal("HisInterval", "60"));
}

} // namespace

bool isKnownColumnSource(const std::string& source) {
    if (source.empty() || source.front() == '=') {
        return true;
    }
    for (const auto* name : kPlainSources) {
        if (source == name) {
            return true;
        }
    }
    const auto dot = source.find('.');
    if (dot == std::string::npos) {
        return false;
    }
    const auto prefix = source.substr(0, dot);
    const auto field = source.substr(dot + 1);
    bool knownPrefix = false;
    for (const auto* name : kExtensionNames) {
        knownPrefix = knownPrefix || prefix == name;
    }
    bool knownField = false;
    for (const auto* name : kExtensionFields) {
        knownField = knownField || field == name;
    }
    return knownPrefix && knownField;
}

bool validateTemplate(const TableTemplate& tableTemplate, Error& outError) {
    if (tableTemplate.columns.empty()) {
        outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name, "template declares no columns");
        return false;
    }
    for (const auto& spec : tableTemplate.columns) {
        if (spec.header.empty()) {
            outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name, "column header cannot be empty");
            return false;
        }
        if (!isKnownColumnSource(spec.source)) {
            outError = makeError(ErrorKind::InvalidTemplate, tableTemplate.name,
                                 "column '" + spec.header + "' uses unknown source '" + spec.source + "'");
            return false;
        }
    }
    return true;
}

TableTemplate BuiltinTemplates::plc() {
    namespace cs = column_sources;
    TableTemplate t;
    t.name = "plc";
    t.kind = TableKind::Plc;
    t.columns = {
        column("序号", cs::kIndex),
        column("模块", cs::kModuleId),
        column("变量名", cs::kTag, true),
        column("直接地址", cs::kPlcAddress, true),
        column("变量说明", cs::kComment),
        column("变量类型", cs::kDataType, true),
        column("初始值", cs::kInitialValue),
        column("掉电保护", cs::kPowerProtect),
        column("可强制", cs::kForcible),
        column("SOE使能", cs::kSoeEnable),
    };
    return t;
}

TableTemplate BuiltinTemplates::hmiDisc() {
    namespace cs = column_sources;
    TableTemplate t;
    t.name = "hmi-disc";
    t.kind = TableKind::HmiBool;
    t.columns = {
        column("TagID", cs::kTagId, true),
        column("TagName", cs::kTag, true),
        column("Description", cs::kDescription),
        literal("TagType", "用户变量"),
        literal("TagDataType", "IODisc"),
        column("DeviceName", cs::kStation),
        column("TagGroup", cs::kStation),
    };
    appendHmiChannelColumns(t.columns);
    t.columns.push_back(literal("RegName", "0"));
    t.columns.push_back(literal("RegType", "0"));
    t.columns.push_back(literal("ItemDataType", "BIT"));
    appendHmiHistoryColumns(t.columns);
    t.columns.push_back(column("SignalType", cs::kDiscreteType));
    return t;
}

TableTemplate BuiltinTemplates::hmiFloat() {
    namespace cs = column_sources;
    TableTemplate t;
    t.name = "hmi-float";
    t.kind = TableKind::HmiReal;
    t.columns = {
        column("TagID", cs::kTagId, true),
        column("TagName", cs::kTag, true),
        column("Description", cs::kDescription),
        literal("TagType", "用户变量"),
        literal("TagDataType", "IOFloat"),
        literal("MaxRawValue", "1000000000.000000"),
        literal("MinRawValue", "-1000000000.000000"),
        literal("MaxValue", "1000000000.000000"),
        literal("MinValue", "-1000000000.000000"),
        column("EngineeringLow", cs::kRangeLow),
        column("EngineeringHigh", cs::kRangeHigh),
        literal("ConvertType", "无"),
        literal("IsFilter", "否"),
        literal("DeadBand", "0"),
        column("DeviceName", cs::kStation),
        column("TagGroup", cs::kStation),
    };
    appendHmiChannelColumns(t.columns);
    t.columns.push_back(literal("RegName", "4"));
    t.columns.push_back(literal("RegType", "3"));
    t.columns.push_back(literal("ItemDataType", "FLOAT"));
    appendHmiHistoryColumns(t.columns);
    return t;
}

TableTemplate BuiltinTemplates::fat() {
    namespace cs = column_sources;
    TableTemplate t;
    t.name = "fat";
    t.kind = TableKind::Fat;
    t.columns = {
        column("序号", cs::kIndex),
        column("模块名称", cs::kItemName),
        column("模块类型", cs::kSignalClass),
        column("供电类型（有源/无源）", "", false, "/"),
        column("线制", "", false, "/"),
        column("通道位号", cs::kChannelCode),
        column("位号", cs::kItemId, false, "/"),
        column("场站名", cs::kStation),
        column("变量名称（HMI）", cs::kTag, false, "/"),
        column("变量描述", cs::kDescription, false, "/"),
        column("数据类型", cs::kDataType),
        column("读写属性", cs::kReadWrite),
        column("保存历史", cs::kSaveHistory),
        literal("掉电保护", "是"),
        column("量程低限", cs::kRangeLow, false, "/"),
        column("量程高限", cs::kRangeHigh, false, "/"),
    };

    const std::array<std::pair<const char*, const char*>, 4> setPoints = {{
        {"SLL", "LoLoLimit"}, {"SL", "LoLimit"}, {"SH", "HiLimit"}, {"SHH", "HiHiLimit"},
    }};
    for (const auto& [label, ext] : setPoints) {
        const std::string base = label;
        const std::string prefix = ext;
        t.columns.push_back(column((base + "设定值").c_str(), "", false, "/"));
        t.columns.push_back(column((base + "设定点位").c_str(), prefix + ".tag"));
        t.columns.push_back(column((base + "设定点位_PLC地址").c_str(), prefix + ".plcAddress"));
        t.columns.push_back(column((base + "设定点位_通讯地址").c_str(), prefix + ".commAddress"));
    }
    for (const char* level : {"LL", "L", "H", "HH"}) {
        const std::string base = std::string(level) + "报警";
        const std::string prefix = level;
        t.columns.push_back(column(base.c_str(), prefix + ".tag"));
        t.columns.push_back(column((base + "_PLC地址").c_str(), prefix + ".plcAddress"));
        t.columns.push_back(column((base + "_通讯地址").c_str(), prefix + ".commAddress"));
    }
    t.columns.push_back(column("维护值设定", ""));
    t.columns.push_back(column("维护值设定点位", "whz.tag"));
    t.columns.push_back(column("维护值设定点位_PLC地址", "whz.plcAddress"));
    t.columns.push_back(column("维护值设定点位_通讯地址", "whz.commAddress"));
    t.columns.push_back(column("维护使能开关点位", "MAIN_EN.tag"));
    t.columns.push_back(column("维护使能开关点位_PLC地址", "MAIN_EN.plcAddress"));
    t.columns.push_back(column("维护使能开关点位_通讯地址", "MAIN_EN.commAddress"));
    t.columns.push_back(column("PLC绝对地址", cs::kPlcAddress));
    t.columns.push_back(column("上位机通讯地址", cs::kCommAddress));
    return t;
}

bool BuiltinTemplates::byName(const std::string& name, TableTemplate& outTemplate, Error& outError) {
    if (name == "plc") {
        outTemplate = plc();
    } else if (name == "hmi-disc") {
        outTemplate = hmiDisc();
    } else if (name == "hmi-float") {
        outTemplate = hmiFloat();
    } else if (name == "fat") {
        outTemplate = fat();
    } else {
        outError = makeError(ErrorKind::InvalidTemplate, name, "no built-in template with this name");
        return false;
    }
    return true;
}

const char* toString(TableKind kind) {
    switch (kind) {
    case TableKind::Plc:
        return "plc";
    case TableKind::HmiBool:
        return "hmi-bool";
    case TableKind::HmiReal:
        return "hmi-real";
    case TableKind::Fat:
        return "fat";
    }
    return "unknown";
}

std::optional<TableKind> parseTableKind(const std::string& text) {
    if (text == "plc") {
        return TableKind::Plc;
    }
    if (text == "hmi-bool") {
        return TableKind::HmiBool;
    }
    if (text == "hmi-real") {
        return TableKind::HmiReal;
    }
    if (text == "fat") {
        return TableKind::Fat;
    }
    return std::nullopt;
}

} // namespace ioc
