// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightError.hpp"
#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IPanel.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Spotlight {

// Panel lifecycle entry points. Everything except center() may be called from
// any thread; initSpotlightWindow() only needs the widget to exist already.
class SPOTLIGHT_EXPORT ISpotlightManager : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~ISpotlightManager() override = default;

    virtual const PluginConfig& config() const = 0;
    virtual bool supportsPanels() const = 0;

    // Converts \a window (matched by objectName) into a panel when it is
    // configured. Unconfigured windows and repeated calls succeed as no-ops.
    virtual SpotlightError initSpotlightWindow(QWidget* window) = 0;

    virtual SpotlightError panel(const QString& label, Api::PanelHandle& out) const = 0;

    virtual SpotlightError show(const QString& label) = 0;
    virtual SpotlightError hide(const QString& label) = 0;
    virtual SpotlightError toggle(const QString& label) = 0;
    virtual SpotlightError hideAll() = 0;

    // Centers the panel on the monitor under the pointer.
    virtual SpotlightError center(const QString& label) = 0;

signals:
    void panelRegistered(const QString& label);
};

} // namespace Spotlight
