// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Spotlight {

SPOTLIGHT_EXPORT Utils::Result parsePluginConfig(const QJsonObject& json, PluginConfig& out);
SPOTLIGHT_EXPORT QJsonObject serializePluginConfig(const PluginConfig& config);

SPOTLIGHT_EXPORT Utils::Result parsePluginConfig(const QByteArray& jsonText, PluginConfig& out);
SPOTLIGHT_EXPORT Utils::Result loadPluginConfigFile(const QString& path, PluginConfig& out);

} // namespace Spotlight
