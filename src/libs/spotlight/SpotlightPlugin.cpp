// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightPlugin.hpp"
#include "spotlight/SpotlightManager.hpp"
#include "spotlight/SpotlightWindowWatcher.hpp"
#include "spotlight/api/ISpotlightManager.hpp"

#include <utils/Macros.hpp>

#include <QtCore/QCoreApplication>

namespace Spotlight {

namespace {

const QString kPluginObjectName = QStringLiteral("Spotlight.Plugin");

} // namespace

SpotlightPlugin::SpotlightPlugin(ISpotlightManager* manager, QCoreApplication* app)
    : QObject(app)
    , m_manager(manager)
{
    setObjectName(kPluginObjectName);
    m_manager->setParent(this);

    m_watcher = new SpotlightWindowWatcher(manager, this);
    app->installEventFilter(m_watcher);
    m_watcher->attachExisting();
}

SpotlightPlugin* SpotlightPlugin::install(QCoreApplication* app, const PluginConfig& config)
{
    UTILS_GUARD_RET(app, nullptr);

    if (SpotlightPlugin* existing = instance(app)) {
        qCWarning(spotlightlog) << "spotlight plugin already installed; ignoring new configuration";
        return existing;
    }
    return install(app, createPlatformManager(config));
}

SpotlightPlugin* SpotlightPlugin::install(QCoreApplication* app, ISpotlightManager* manager)
{
    UTILS_GUARD_RET(app && manager, nullptr);

    if (SpotlightPlugin* existing = instance(app)) {
        qCWarning(spotlightlog) << "spotlight plugin already installed; discarding manager";
        if (manager != existing->manager())
            delete manager;
        return existing;
    }

    auto* plugin = new SpotlightPlugin(manager, app);
    qCInfo(spotlightlog) << "spotlight plugin installed," << manager->config().labels().size()
                         << "configured window(s), native panels"
                         << (manager->supportsPanels() ? "enabled" : "unavailable");
    return plugin;
}

SpotlightPlugin* SpotlightPlugin::instance(const QCoreApplication* app)
{
    UTILS_GUARD_RET(app, nullptr);
    return app->findChild<SpotlightPlugin*>(kPluginObjectName, Qt::FindDirectChildrenOnly);
}

ISpotlightManager* spotlight(const QCoreApplication* app)
{
    SpotlightPlugin* plugin = SpotlightPlugin::instance(app);
    return plugin ? plugin->manager() : nullptr;
}

} // namespace Spotlight
