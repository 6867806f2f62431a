// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "SpotlightTestFakes.hpp"

#include "spotlight/NullSpotlightManager.hpp"

using namespace Spotlight;

TEST(NullSpotlightManagerTests, EveryOperationSucceedsWithoutPanels)
{
    Tests::ensureApp();

    PluginConfig config;
    WindowConfig main;
    main.label = QStringLiteral("main");
    main.shortcut = QStringLiteral("Ctrl+I");
    config.windows = QVector<WindowConfig>{main};
    config.globalCloseShortcut = QStringLiteral("Escape");

    NullSpotlightManager manager(config);
    EXPECT_FALSE(manager.supportsPanels());
    EXPECT_EQ(manager.config(), config);

    QWidget window;
    window.setObjectName(QStringLiteral("main"));
    EXPECT_TRUE(manager.initSpotlightWindow(&window).ok());
    EXPECT_TRUE(manager.initSpotlightWindow(nullptr).ok());

    EXPECT_TRUE(manager.show(QStringLiteral("main")).ok());
    EXPECT_TRUE(manager.hide(QStringLiteral("main")).ok());
    EXPECT_TRUE(manager.toggle(QStringLiteral("main")).ok());
    EXPECT_TRUE(manager.hideAll().ok());
    EXPECT_TRUE(manager.center(QStringLiteral("main")).ok());

    Api::PanelHandle handle;
    EXPECT_EQ(manager.panel(QStringLiteral("main"), handle).code(), SpotlightErrorCode::NotFound);
    EXPECT_FALSE(handle);
}
