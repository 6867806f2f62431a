// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightConstants.hpp"

using namespace Spotlight;

namespace {

WindowConfig window(const QString& label, std::optional<QString> shortcut = std::nullopt)
{
    WindowConfig w;
    w.label = label;
    w.shortcut = std::move(shortcut);
    return w;
}

PluginConfig withWindows(QVector<WindowConfig> windows, std::optional<QString> closeShortcut = std::nullopt)
{
    PluginConfig config;
    config.windows = std::move(windows);
    config.globalCloseShortcut = std::move(closeShortcut);
    return config;
}

} // namespace

TEST(SpotlightConfigTests, WindowDefaults)
{
    const WindowConfig w = window(QStringLiteral("main"));
    EXPECT_EQ(w.effectiveStackingLevel(), 25);
    EXPECT_EQ(w.effectiveStackingLevel(), Constants::kMainMenuWindowLevel + 1);
    EXPECT_TRUE(w.effectiveAutoHide());

    WindowConfig custom = w;
    custom.stackingLevel = 3;
    custom.autoHide = false;
    EXPECT_EQ(custom.effectiveStackingLevel(), 3);
    EXPECT_FALSE(custom.effectiveAutoHide());
}

TEST(SpotlightConfigTests, LookupReturnsFirstMatch)
{
    const PluginConfig config = withWindows({window(QStringLiteral("a"), QStringLiteral("Ctrl+A")),
                                             window(QStringLiteral("a"), QStringLiteral("Ctrl+B"))});

    const auto found = config.windowConfig(QStringLiteral("a"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->shortcut, QStringLiteral("Ctrl+A"));
    EXPECT_FALSE(config.windowConfig(QStringLiteral("missing")).has_value());
    EXPECT_FALSE(PluginConfig{}.windowConfig(QStringLiteral("a")).has_value());
}

TEST(SpotlightConfigTests, MergeWithEmptyIsIdentity)
{
    const PluginConfig config = withWindows({window(QStringLiteral("a")), window(QStringLiteral("b"))},
                                            QStringLiteral("Escape"));

    EXPECT_EQ(PluginConfig::merge(config, PluginConfig{}), config);
    EXPECT_EQ(PluginConfig::merge(PluginConfig{}, config), config);
}

TEST(SpotlightConfigTests, MergePrefersPrimaryEntryAndCloseShortcut)
{
    const PluginConfig primary = withWindows({window(QStringLiteral("a"), QStringLiteral("X"))},
                                             QStringLiteral("Escape"));
    const PluginConfig secondary = withWindows({window(QStringLiteral("a"), QStringLiteral("Y"))},
                                               QStringLiteral("Ctrl+W"));

    const PluginConfig merged = PluginConfig::merge(primary, secondary);
    ASSERT_TRUE(merged.windows.has_value());
    ASSERT_EQ(merged.windows->size(), 1);
    EXPECT_EQ(merged.windows->at(0).shortcut, QStringLiteral("X"));
    EXPECT_EQ(merged.globalCloseShortcut, QStringLiteral("Escape"));
}

TEST(SpotlightConfigTests, MergeDoesNotMergeFieldsOfSameLabel)
{
    WindowConfig primaryWindow = window(QStringLiteral("a"));
    WindowConfig secondaryWindow = window(QStringLiteral("a"), QStringLiteral("Ctrl+Y"));
    secondaryWindow.stackingLevel = 7;

    const PluginConfig merged = PluginConfig::merge(withWindows({primaryWindow}), withWindows({secondaryWindow}));
    ASSERT_TRUE(merged.windows.has_value());
    ASSERT_EQ(merged.windows->size(), 1);
    EXPECT_FALSE(merged.windows->at(0).shortcut.has_value());
    EXPECT_FALSE(merged.windows->at(0).stackingLevel.has_value());
}

TEST(SpotlightConfigTests, MergeKeepsPrimaryOrderThenSecondaryOnlyEntries)
{
    const PluginConfig primary = withWindows({window(QStringLiteral("c")), window(QStringLiteral("a"))});
    const PluginConfig secondary = withWindows({window(QStringLiteral("b")), window(QStringLiteral("a")),
                                                window(QStringLiteral("d"))});

    const PluginConfig merged = PluginConfig::merge(primary, secondary);
    EXPECT_EQ(merged.labels(), (QStringList{"c", "a", "b", "d"}));
}

TEST(SpotlightConfigTests, MergeWithoutPrimaryWindowsTakesSecondaryOnce)
{
    const PluginConfig secondary = withWindows({window(QStringLiteral("a")), window(QStringLiteral("b"))});

    const PluginConfig merged = PluginConfig::merge(PluginConfig{}, secondary);
    EXPECT_EQ(merged.labels(), (QStringList{"a", "b"}));
}

TEST(SpotlightConfigTests, MergeDropsLaterDuplicates)
{
    const PluginConfig primary = withWindows({window(QStringLiteral("a"), QStringLiteral("1")),
                                              window(QStringLiteral("a"), QStringLiteral("2"))});
    const PluginConfig secondary = withWindows({window(QStringLiteral("b")), window(QStringLiteral("b"))});

    const PluginConfig merged = PluginConfig::merge(primary, secondary);
    EXPECT_EQ(merged.labels(), (QStringList{"a", "b"}));
    EXPECT_EQ(merged.windowConfig(QStringLiteral("a"))->shortcut, QStringLiteral("1"));
}

TEST(SpotlightConfigTests, MergeCollapsesEmptyWindowListToAbsent)
{
    const PluginConfig merged = PluginConfig::merge(withWindows({}), withWindows({}));
    EXPECT_FALSE(merged.windows.has_value());
    EXPECT_TRUE(merged.isEmpty());
}

TEST(SpotlightConfigTests, MergeFallsBackToSecondaryCloseShortcut)
{
    PluginConfig secondary;
    secondary.globalCloseShortcut = QStringLiteral("Escape");

    const PluginConfig merged = PluginConfig::merge(withWindows({window(QStringLiteral("a"))}), secondary);
    EXPECT_EQ(merged.globalCloseShortcut, QStringLiteral("Escape"));
}
