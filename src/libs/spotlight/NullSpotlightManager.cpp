// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/NullSpotlightManager.hpp"

#include <QtWidgets/QWidget>

namespace Spotlight {

NullSpotlightManager::NullSpotlightManager(PluginConfig config, QObject* parent)
    : ISpotlightManager(parent)
    , m_config(std::move(config))
{
    if (!m_config.isEmpty())
        qCInfo(spotlightlog) << "native panels are not available on this platform; spotlight windows stay regular windows";
}

const PluginConfig& NullSpotlightManager::config() const
{
    return m_config;
}

SpotlightError NullSpotlightManager::initSpotlightWindow(QWidget* window)
{
    if (window && m_config.windowConfig(window->objectName()))
        qCDebug(spotlightlog) << "skipping panel conversion for" << window->objectName();
    return SpotlightError::none();
}

SpotlightError NullSpotlightManager::panel(const QString& label, Api::PanelHandle& out) const
{
    out.reset();
    return SpotlightError::notFound(label);
}

} // namespace Spotlight
