// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightConfigJson.hpp"
#include "spotlight/SpotlightConstants.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>
#include <QtCore/QSet>

#include <cmath>
#include <limits>

namespace Spotlight {

namespace {

QString key(const char* name)
{
    return QString::fromLatin1(name);
}

bool readOptionalString(const QJsonValue& value, std::optional<QString>& out)
{
    if (value.isUndefined() || value.isNull())
        return true;
    if (!value.isString())
        return false;
    out = value.toString();
    return true;
}

void parseWindow(const QJsonObject& obj, int index, QVector<WindowConfig>& windows,
                 QSet<QString>& seenLabels, QStringList& errors)
{
    const QJsonValue labelValue = obj.value(key(Constants::kConfigLabelKey));
    const QString label = labelValue.toString().trimmed();
    if (!labelValue.isString() || label.isEmpty()) {
        errors.push_back(QStringLiteral("windows[%1] is missing a label.").arg(index));
        return;
    }

    WindowConfig window;
    window.label = label;

    if (!readOptionalString(obj.value(key(Constants::kConfigShortcutKey)), window.shortcut))
        errors.push_back(QStringLiteral("windows[%1].shortcut must be a string.").arg(index));

    const QJsonValue level = obj.value(key(Constants::kConfigStackingLevelKey));
    if (!level.isUndefined() && !level.isNull()) {
        const double value = level.toDouble();
        const bool integral = level.isDouble() && value == std::floor(value)
            && value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
        if (!integral)
            errors.push_back(QStringLiteral("windows[%1].%2 must be an integer.")
                                 .arg(index).arg(key(Constants::kConfigStackingLevelKey)));
        else
            window.stackingLevel = static_cast<int>(value);
    }

    const QJsonValue autoHide = obj.value(key(Constants::kConfigAutoHideKey));
    if (!autoHide.isUndefined() && !autoHide.isNull()) {
        if (!autoHide.isBool())
            errors.push_back(QStringLiteral("windows[%1].%2 must be a boolean.")
                                 .arg(index).arg(key(Constants::kConfigAutoHideKey)));
        else
            window.autoHide = autoHide.toBool();
    }

    if (seenLabels.contains(label)) {
        qCWarning(spotlightlog).noquote()
            << QStringLiteral("Ignoring duplicate spotlight window '%1' at windows[%2].").arg(label).arg(index);
        return;
    }
    seenLabels.insert(label);
    windows.push_back(window);
}

} // namespace

Utils::Result parsePluginConfig(const QJsonObject& json, PluginConfig& out)
{
    out = PluginConfig{};
    QStringList errors;

    const QJsonValue windowsValue = json.value(key(Constants::kConfigWindowsKey));
    if (!windowsValue.isUndefined() && !windowsValue.isNull()) {
        if (!windowsValue.isArray()) {
            errors.push_back(QStringLiteral("windows must be an array."));
        } else {
            const QJsonArray array = windowsValue.toArray();
            QVector<WindowConfig> windows;
            windows.reserve(array.size());
            QSet<QString> seenLabels;
            for (int i = 0; i < array.size(); ++i) {
                if (!array.at(i).isObject()) {
                    errors.push_back(QStringLiteral("windows[%1] must be an object.").arg(i));
                    continue;
                }
                parseWindow(array.at(i).toObject(), i, windows, seenLabels, errors);
            }
            out.windows = std::move(windows);
        }
    }

    if (!readOptionalString(json.value(key(Constants::kConfigGlobalCloseShortcutKey)), out.globalCloseShortcut))
        errors.push_back(QStringLiteral("global_close_shortcut must be a string."));

    if (!errors.isEmpty())
        return Utils::Result::failure(errors);
    return Utils::Result::success();
}

QJsonObject serializePluginConfig(const PluginConfig& config)
{
    QJsonObject root;

    if (config.windows) {
        QJsonArray windows;
        for (const WindowConfig& window : *config.windows) {
            QJsonObject obj;
            obj.insert(key(Constants::kConfigLabelKey), window.label);
            if (window.shortcut)
                obj.insert(key(Constants::kConfigShortcutKey), *window.shortcut);
            if (window.stackingLevel)
                obj.insert(key(Constants::kConfigStackingLevelKey), *window.stackingLevel);
            if (window.autoHide)
                obj.insert(key(Constants::kConfigAutoHideKey), *window.autoHide);
            windows.push_back(obj);
        }
        root.insert(key(Constants::kConfigWindowsKey), windows);
    }

    if (config.globalCloseShortcut)
        root.insert(key(Constants::kConfigGlobalCloseShortcutKey), *config.globalCloseShortcut);

    return root;
}

Utils::Result parsePluginConfig(const QByteArray& jsonText, PluginConfig& out)
{
    out = PluginConfig{};

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(jsonText, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return Utils::Result::failure(QStringLiteral("Invalid spotlight configuration: %1")
                                          .arg(parseError.errorString()));
    if (!doc.isObject())
        return Utils::Result::failure(QStringLiteral("Spotlight configuration must be a JSON object."));

    return parsePluginConfig(doc.object(), out);
}

Utils::Result loadPluginConfigFile(const QString& path, PluginConfig& out)
{
    out = PluginConfig{};

    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Utils::Result::failure(QStringLiteral("Spotlight configuration path is empty."));

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly))
        return Utils::Result::failure(QStringLiteral("Failed to open spotlight configuration: %1 (%2)")
                                          .arg(cleanedPath, file.errorString()));

    Utils::Result result = parsePluginConfig(file.readAll(), out);
    if (!result) {
        for (QString& error : result.errors)
            error = QStringLiteral("%1: %2").arg(cleanedPath, error);
    }
    return result;
}

} // namespace Spotlight
