/**
 * @file catalog_loader.cpp
 * @brief iochannel source file.
 */

#include "iochannel/config/catalog_loader.hpp"

#include <stdexcept>
#include <utility>

#include "iochannel/config/text_extract.hpp"

namespace ioc {
namespace {

bool parseModuleTag(const std::string& tag, ChannelModel& outModel, std::string& outError) {
    const auto type = text::attr(tag, "type");
    const auto signalClass = text::attr(tag, "signalClass");
    const auto capacity = text::attr(tag, "capacity");
    const auto baseAddress = text::attr(tag, "baseAddress");
    if (!type || !signalClass || !capacity || !baseAddress) {
        outError = "<Module> needs type, signalClass, capacity and baseAddress: " + tag;
        return false;
    }

    const auto parsedClass = parseSignalClass(*signalClass);
    if (!parsedClass) {
        outError = "Module '" + *type + "' has unknown signalClass '" + *signalClass + "'";
        return false;
    }

    ChannelModel model;
    model.moduleType = *type;
    model.signalClass = *parsedClass;
    model.capacity = text::parseInteger(*capacity);
    model.baseAddress = text::parseInteger(*baseAddress);
    if (const auto stride = text::attr(tag, "channelStride")) {
        model.channelStride = text::parseInteger(*stride);
    }
    if (const auto stride = text::attr(tag, "instanceStride")) {
        model.instanceStride = text::parseInteger(*stride);
    } else {
        model.instanceStride = model.capacity * model.channelStride;
    }
    if (const auto priority = text::attr(tag, "priority")) {
        model.priority = static_cast<int>(text::parseInteger(*priority));
    }
    if (const auto maxInstances = text::attr(tag, "maxInstances")) {
        model.maxInstances = text::parseInteger(*maxInstances);
    }
    outModel = std::move(model);
    return true;
}

bool parseExtensionTag(const std::string& tag, ExtensionArea& outArea, std::string& outError) {
    const auto dataType = text::attr(tag, "dataType");
    const auto baseAddress = text::attr(tag, "baseAddress");
    if (!dataType || !baseAddress) {
        outError = "<ExtensionArea> needs dataType and baseAddress: " + tag;
        return false;
    }
    const auto parsedType = parseDataType(*dataType);
    if (!parsedType) {
        outError = "ExtensionArea has unknown dataType '" + *dataType + "'";
        return false;
    }
    outArea.dataType = *parsedType;
    outArea.baseAddress = text::parseInteger(*baseAddress);
    outArea.stride = (*parsedType == DataType::Real) ? 4 : 1;
    if (const auto stride = text::attr(tag, "stride")) {
        outArea.stride = text::parseInteger(*stride);
    }
    return true;
}

bool parseCatalogXml(const std::string& xml, ChannelModelCatalog::Definition& definition, std::string& outError) {
    try {
        const auto header = text::extractTags(xml, "Catalog");
        if (!header.empty()) {
            definition.version = text::attr(header.front(), "version").value_or("");
        }

        for (const auto& tag : text::extractTags(xml, "Module")) {
            ChannelModel model;
            if (!parseModuleTag(tag, model, outError)) {
                return false;
            }
            definition.models.push_back(std::move(model));
        }

        const auto racks = text::extractTags(xml, "RackLayout");
        if (!racks.empty()) {
            if (const auto model = text::attr(racks.front(), "model")) {
                definition.rackLayout.rackModel = *model;
            }
            if (const auto slots = text::attr(racks.front(), "slotsPerRack")) {
                definition.rackLayout.slotsPerRack = text::parseInteger(*slots);
            }
            if (const auto first = text::attr(racks.front(), "firstSlot")) {
                definition.rackLayout.firstSlot = text::parseInteger(*first);
            }
        }

        for (const auto& tag : text::extractTags(xml, "ExtensionArea")) {
            ExtensionArea area;
            if (!parseExtensionTag(tag, area, outError)) {
                return false;
            }
            definition.extensionAreas.push_back(area);
        }

        if (definition.models.empty()) {
            outError = "No <Module ...> entries found in catalog";
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        outError = std::string("Catalog parse error: ") + ex.what();
        return false;
    }
}

} // namespace

bool CatalogLoader::loadFromXmlFile(const std::string& path, ChannelModelCatalog& outCatalog, Error& outError) {
    outError.clear();

    std::string xml;
    std::string ioError;
    if (!text::readFile(path, xml, ioError)) {
        outError = makeError(ErrorKind::ConfigIo, path, ioError);
        return false;
    }
    return loadFromXmlString(xml, outCatalog, outError);
}

bool CatalogLoader::loadFromXmlString(const std::string& xml, ChannelModelCatalog& outCatalog, Error& outError) {
    outError.clear();

    ChannelModelCatalog::Definition definition;
    std::string parseError;
    if (!parseCatalogXml(xml, definition, parseError)) {
        outError = makeError(ErrorKind::InvalidModuleModel, definition.version, parseError);
        return false;
    }
    return ChannelModelCatalog::create(std::move(definition), outCatalog, outError);
}

} // namespace ioc
