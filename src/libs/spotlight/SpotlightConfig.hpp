// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>

namespace Spotlight {

struct SPOTLIGHT_EXPORT WindowConfig final {
    QString label;
    std::optional<QString> shortcut;
    std::optional<int> stackingLevel;
    std::optional<bool> autoHide;

    int effectiveStackingLevel() const;
    bool effectiveAutoHide() const;

    friend bool operator==(const WindowConfig&, const WindowConfig&) = default;
};

struct SPOTLIGHT_EXPORT PluginConfig final {
    std::optional<QVector<WindowConfig>> windows;
    std::optional<QString> globalCloseShortcut;

    /// First entry whose label matches, if any.
    std::optional<WindowConfig> windowConfig(const QString& label) const;

    /// Labels of all configured windows, in configuration order.
    QStringList labels() const;

    bool isEmpty() const { return !windows.has_value() && !globalCloseShortcut.has_value(); }

    /// Layers \a primary over \a secondary. Whole-entry precedence: a window
    /// label present in both is taken from \a primary without field merging.
    /// Later duplicates of a label are dropped, and an empty window list
    /// collapses to an absent one.
    static PluginConfig merge(const PluginConfig& primary, const PluginConfig& secondary);

    friend bool operator==(const PluginConfig&, const PluginConfig&) = default;
};

} // namespace Spotlight
