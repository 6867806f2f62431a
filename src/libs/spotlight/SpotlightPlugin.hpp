// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>

QT_BEGIN_NAMESPACE
class QCoreApplication;
QT_END_NAMESPACE

namespace Spotlight {

class ISpotlightManager;
class SpotlightWindowWatcher;

// Owns the manager and the window watcher for one application. Parented to
// the application, so both live until it is destroyed.
class SPOTLIGHT_EXPORT SpotlightPlugin final : public QObject {
    Q_OBJECT

public:
    // Installs the platform manager built from \a config. Returns the already
    // installed plugin if there is one.
    static SpotlightPlugin* install(QCoreApplication* app, const PluginConfig& config);

    // Installs \a manager, taking ownership of it.
    static SpotlightPlugin* install(QCoreApplication* app, ISpotlightManager* manager);

    static SpotlightPlugin* instance(const QCoreApplication* app);

    ISpotlightManager* manager() const { return m_manager; }
    SpotlightWindowWatcher* watcher() const { return m_watcher; }

private:
    SpotlightPlugin(ISpotlightManager* manager, QCoreApplication* app);

    QPointer<ISpotlightManager> m_manager;
    QPointer<SpotlightWindowWatcher> m_watcher;
};

// Manager installed on \a app, or nullptr when no plugin is installed.
SPOTLIGHT_EXPORT ISpotlightManager* spotlight(const QCoreApplication* app);

} // namespace Spotlight
