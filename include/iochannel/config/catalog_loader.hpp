/**
 * @file catalog_loader.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>

#include "iochannel/catalog/channel_model_catalog.hpp"
#include "iochannel/core/error.hpp"

namespace ioc {

/**
 * @brief Loads a channel model catalog from an XML-like file.
 *
 * Recognized tags:
 * - `<Catalog version="..."/>`
 * - `<Module type="LK610" signalClass="DI" capacity="16" baseAddress="160"
 *   channelStride="1" instanceStride="16" priority="0" maxInstances="20"/>`
 *   (`instanceStride` defaults to capacity * channelStride)
 * - `<RackLayout model="LK117" slotsPerRack="10" firstSlot="2"/>`
 * - `<ExtensionArea dataType="REAL" baseAddress="2000" stride="4"/>`
 *
 * The parsed definition goes through `ChannelModelCatalog::create`, so a catalog that
 * loads is always valid.
 */
class CatalogLoader {
public:
    /**
     * @param outError `ConfigIo` for unreadable files, `InvalidModuleModel` for malformed
     * or inconsistent entries.
     */
    static bool loadFromXmlFile(const std::string& path, ChannelModelCatalog& outCatalog, Error& outError);
    static bool loadFromXmlString(const std::string& xml, ChannelModelCatalog& outCatalog, Error& outError);
};

} // namespace ioc
