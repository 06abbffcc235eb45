/**
 * @file channel_model_catalog.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>
#include <vector>

#include "iochannel/catalog/channel_model.hpp"
#include "iochannel/core/error.hpp"

namespace ioc {

/**
 * @brief Validated, read-only set of channel models.
 *
 * A catalog is only obtainable through `create()` (or `builtin()`), so every instance
 * in circulation has passed `CatalogValidator`. Calculation runs take it by const
 * reference and may share it freely.
 */
class ChannelModelCatalog {
public:
    /**
     * @brief Unvalidated catalog content as declared in configuration.
     */
    struct Definition {
        std::string version;
        std::vector<ChannelModel> models;
        RackLayout rackLayout;
        std::vector<ExtensionArea> extensionAreas;
    };

    ChannelModelCatalog() = default;

    /**
     * @brief Validate `definition` and build a catalog from it.
     * @return false with `ErrorKind::InvalidModuleModel` listing every fatal finding.
     */
    static bool create(Definition definition, ChannelModelCatalog& outCatalog, Error& outError);

    /**
     * @brief Default LK-series catalog (LK610 DI, LK710 DO, LK411 AI, LK512 AO).
     */
    static const ChannelModelCatalog& builtin();

    /**
     * @brief Resolve a module type identifier.
     * @return nullptr with `ErrorKind::UnknownModuleType` if not registered.
     */
    const ChannelModel* lookup(const std::string& moduleType, Error& outError) const;

    /**
     * @brief Models serving `signalClass`, in allocation priority order.
     */
    std::vector<const ChannelModel*> modelsFor(SignalClass signalClass) const;

    /**
     * @brief First model (declaration order) whose type identifier occurs in `specModelText`.
     */
    const ChannelModel* matchSpecModel(const std::string& specModelText) const;

    const ExtensionArea* extensionArea(DataType dataType) const;

    const std::vector<ChannelModel>& models() const noexcept { return definition_.models; }
    const std::string& version() const noexcept { return definition_.version; }
    const RackLayout& rackLayout() const noexcept { return definition_.rackLayout; }
    const std::vector<ExtensionArea>& extensionAreas() const noexcept { return definition_.extensionAreas; }

private:
    Definition definition_;
};

} // namespace ioc
