// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/MonitorLocator.hpp"

#include <QtGui/QCursor>
#include <QtGui/QGuiApplication>
#include <QtGui/QScreen>

#include <cmath>

namespace Spotlight {

std::optional<Api::MonitorInfo> QtMonitorLocator::monitorUnderPointer() const
{
    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance()))
        return std::nullopt;

    const QScreen* screen = QGuiApplication::screenAt(QCursor::pos());
    if (!screen)
        return std::nullopt;

    const qreal scale = screen->devicePixelRatio();
    const QRect geometry = screen->geometry();

    Api::MonitorInfo info;
    info.scaleFactor = scale;
    info.size = QSize(qRound(geometry.width() * scale), qRound(geometry.height() * scale));
    info.position = QPoint(qRound(geometry.x() * scale), qRound(geometry.y() * scale));
    return info;
}

QPoint centeredOrigin(const Api::MonitorInfo& monitor, const QSize& windowSize)
{
    const qreal scale = monitor.scaleFactor > 0.0 ? monitor.scaleFactor : 1.0;

    const qreal monitorX = monitor.position.x() / scale;
    const qreal monitorY = monitor.position.y() / scale;
    const qreal monitorWidth = monitor.size.width() / scale;
    const qreal monitorHeight = monitor.size.height() / scale;

    const qreal x = monitorX + (monitorWidth - windowSize.width()) / 2.0;
    const qreal y = monitorY + (monitorHeight - windowSize.height()) / 2.0;
    return QPoint(static_cast<int>(std::floor(x)), static_cast<int>(std::floor(y)));
}

} // namespace Spotlight
