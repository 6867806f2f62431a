// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/PanelConversion.hpp"

#include <QtWidgets/QWidget>

namespace Spotlight::Internal {

namespace {

constexpr char kQtWindowClass[] = "QNSWindow";
constexpr char kQtPanelClass[] = "QNSPanel";

} // namespace

void preparePanelWindow(QWidget* window)
{
    if (!window)
        return;
    window->setAttribute(Qt::WA_MacAlwaysShowToolWindow, true);
}

QByteArray panelClassName(const QByteArray& windowClassName)
{
    if (windowClassName.contains(kQtPanelClass))
        return windowClassName;

    const qsizetype at = windowClassName.lastIndexOf(kQtWindowClass);
    if (at < 0)
        return {};

    QByteArray name = windowClassName;
    name.replace(at, qsizetype(sizeof(kQtWindowClass) - 1), kQtPanelClass);
    return name;
}

} // namespace Spotlight::Internal
