// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/PanelRegistry.hpp"
#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IGlobalShortcutBackend.hpp"
#include "spotlight/api/IMonitorLocator.hpp"
#include "spotlight/api/IPanelFactory.hpp"
#include "spotlight/api/ISpotlightManager.hpp"

#include <QtCore/QMutex>

#include <memory>

namespace Spotlight {

class SPOTLIGHT_EXPORT SpotlightManager final : public ISpotlightManager {
    Q_OBJECT

public:
    SpotlightManager(PluginConfig config,
                     std::unique_ptr<Api::IPanelFactory> panelFactory,
                     std::unique_ptr<Api::IGlobalShortcutBackend> shortcuts,
                     std::unique_ptr<Api::IMonitorLocator> monitors,
                     QObject* parent = nullptr);
    ~SpotlightManager() override;

    const PluginConfig& config() const override;
    bool supportsPanels() const override;

    SpotlightError initSpotlightWindow(QWidget* window) override;
    SpotlightError panel(const QString& label, Api::PanelHandle& out) const override;

    SpotlightError show(const QString& label) override;
    SpotlightError hide(const QString& label) override;
    SpotlightError toggle(const QString& label) override;
    SpotlightError hideAll() override;
    SpotlightError center(const QString& label) override;

    const Internal::PanelRegistry& registry() const { return m_registry; }

private:
    enum class PanelRequest : quint8 {
        Toggle,
        Hide,
        HideAll
    };

    // Delivers a callback request to this object's thread.
    void post(PanelRequest request, const QString& label = {});
    void dispatch(PanelRequest request, const QString& label);

    SpotlightError wireShortcuts(const WindowConfig& config);

    const PluginConfig m_config;
    std::unique_ptr<Api::IPanelFactory> m_panelFactory;
    std::unique_ptr<Api::IGlobalShortcutBackend> m_shortcuts;
    std::unique_ptr<Api::IMonitorLocator> m_monitors;

    Internal::PanelRegistry m_registry;
    QMutex m_shortcutMutex;
};

// Full manager on platforms with native panels, NullSpotlightManager elsewhere.
SPOTLIGHT_EXPORT ISpotlightManager* createPlatformManager(const PluginConfig& config, QObject* parent = nullptr);

} // namespace Spotlight
