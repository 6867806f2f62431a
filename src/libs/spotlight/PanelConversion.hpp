// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QByteArray>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Spotlight::Internal {

// Keeps \a window on screen while the application is inactive. The window
// type, flags and native handle are left untouched. GUI thread only.
SPOTLIGHT_EXPORT void preparePanelWindow(QWidget* window);

// Objective-C class that Qt uses for panels with the same instance layout as
// the window class \a windowClassName. Namespaced Qt builds decorate both
// names the same way. Empty when \a windowClassName is not a Qt window class.
SPOTLIGHT_EXPORT QByteArray panelClassName(const QByteArray& windowClassName);

} // namespace Spotlight::Internal
