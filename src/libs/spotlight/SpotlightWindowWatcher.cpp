// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightWindowWatcher.hpp"
#include "spotlight/api/ISpotlightManager.hpp"

#include <QtCore/QEvent>
#include <QtWidgets/QApplication>
#include <QtWidgets/QWidget>

namespace Spotlight {

SpotlightWindowWatcher::SpotlightWindowWatcher(ISpotlightManager* manager, QObject* parent)
    : QObject(parent)
    , m_manager(manager)
{
}

void SpotlightWindowWatcher::attachExisting()
{
    if (!qobject_cast<QApplication*>(QCoreApplication::instance()))
        return;

    const QWidgetList windows = QApplication::topLevelWidgets();
    for (QWidget* window : windows) {
        if (window->isVisible())
            windowReady(window);
    }
}

bool SpotlightWindowWatcher::eventFilter(QObject* watched, QEvent* event)
{
    if (event->type() == QEvent::Show && watched->isWidgetType()) {
        auto* widget = static_cast<QWidget*>(watched);
        if (widget->isWindow())
            windowReady(widget);
    }
    return QObject::eventFilter(watched, event);
}

void SpotlightWindowWatcher::windowReady(QWidget* window)
{
    if (!m_manager || m_seen.contains(window))
        return;

    m_seen.insert(window);
    connect(window, &QObject::destroyed, this, [this](QObject* object) { m_seen.remove(object); });

    const SpotlightError error = m_manager->initSpotlightWindow(window);
    if (error.ok())
        return;

    const QString label = window->objectName();
    qCWarning(spotlightlog).noquote()
        << QStringLiteral("Failed to initialize spotlight window '%1' (%2): %3")
               .arg(label, toString(error.code()), error.message());
    emit initializationFailed(label, error.message());
}

} // namespace Spotlight
