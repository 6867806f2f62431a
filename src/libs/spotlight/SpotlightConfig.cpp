// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightConstants.hpp"

#include <QtCore/QSet>

namespace Spotlight {

int WindowConfig::effectiveStackingLevel() const
{
    return stackingLevel.value_or(Constants::kDefaultStackingLevel);
}

bool WindowConfig::effectiveAutoHide() const
{
    return autoHide.value_or(Constants::kDefaultAutoHide);
}

std::optional<WindowConfig> PluginConfig::windowConfig(const QString& label) const
{
    if (!windows)
        return std::nullopt;

    for (const WindowConfig& window : *windows) {
        if (window.label == label)
            return window;
    }
    return std::nullopt;
}

QStringList PluginConfig::labels() const
{
    QStringList out;
    if (!windows)
        return out;

    out.reserve(windows->size());
    for (const WindowConfig& window : *windows)
        out.push_back(window.label);
    return out;
}

PluginConfig PluginConfig::merge(const PluginConfig& primary, const PluginConfig& secondary)
{
    QVector<WindowConfig> candidates;
    if (primary.windows)
        candidates = *primary.windows;
    else if (secondary.windows)
        candidates = *secondary.windows;

    if (secondary.windows)
        candidates.append(*secondary.windows);

    QVector<WindowConfig> merged;
    merged.reserve(candidates.size());
    QSet<QString> seen;
    for (const WindowConfig& window : std::as_const(candidates)) {
        if (seen.contains(window.label))
            continue;
        seen.insert(window.label);
        merged.push_back(window);
    }

    PluginConfig out;
    if (!merged.isEmpty())
        out.windows = std::move(merged);
    out.globalCloseShortcut = primary.globalCloseShortcut ? primary.globalCloseShortcut
                                                          : secondary.globalCloseShortcut;
    return out;
}

} // namespace Spotlight
