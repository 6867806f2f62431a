// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QString>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Spotlight {

class ISpotlightManager;

// Application-wide event filter that hands every top-level widget to the
// manager the first time it is shown.
class SPOTLIGHT_EXPORT SpotlightWindowWatcher final : public QObject {
    Q_OBJECT

public:
    explicit SpotlightWindowWatcher(ISpotlightManager* manager, QObject* parent = nullptr);

    // Handles top-level widgets that were already visible before the watcher
    // was installed.
    void attachExisting();

    bool hasSeen(const QObject* window) const { return m_seen.contains(window); }

signals:
    void initializationFailed(const QString& label, const QString& message);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void windowReady(QWidget* window);

    QPointer<ISpotlightManager> m_manager;
    QSet<const QObject*> m_seen;
};

} // namespace Spotlight
