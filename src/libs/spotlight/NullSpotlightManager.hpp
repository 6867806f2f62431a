// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/ISpotlightManager.hpp"

namespace Spotlight {

// Used where the platform has no native panels. Windows stay ordinary
// windows and every operation succeeds without doing anything.
class SPOTLIGHT_EXPORT NullSpotlightManager final : public ISpotlightManager {
    Q_OBJECT

public:
    explicit NullSpotlightManager(PluginConfig config, QObject* parent = nullptr);

    const PluginConfig& config() const override;
    bool supportsPanels() const override { return false; }

    SpotlightError initSpotlightWindow(QWidget* window) override;
    SpotlightError panel(const QString& label, Api::PanelHandle& out) const override;

    SpotlightError show(const QString&) override { return SpotlightError::none(); }
    SpotlightError hide(const QString&) override { return SpotlightError::none(); }
    SpotlightError toggle(const QString&) override { return SpotlightError::none(); }
    SpotlightError hideAll() override { return SpotlightError::none(); }
    SpotlightError center(const QString&) override { return SpotlightError::none(); }

private:
    const PluginConfig m_config;
};

} // namespace Spotlight
