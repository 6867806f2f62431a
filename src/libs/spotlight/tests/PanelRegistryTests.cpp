// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "SpotlightTestFakes.hpp"

#include "spotlight/PanelRegistry.hpp"

#include <chrono>
#include <thread>

using namespace Spotlight;
using Spotlight::Internal::PanelRegistry;
using Spotlight::Tests::FakePanel;

namespace {

PanelRegistry::Activator producing(std::shared_ptr<FakePanel> panel, std::atomic<int>* calls = nullptr)
{
    return [panel, calls](Api::PanelHandle& out) {
        if (calls)
            ++*calls;
        out = panel;
        return SpotlightError::none();
    };
}

} // namespace

TEST(PanelRegistryTests, InsertOnceIsIdempotent)
{
    PanelRegistry registry;
    auto panel = std::make_shared<FakePanel>();
    std::atomic<int> calls{0};

    bool inserted = false;
    EXPECT_TRUE(registry.insertOnce(QStringLiteral("main"), producing(panel, &calls), &inserted).ok());
    EXPECT_TRUE(inserted);

    EXPECT_TRUE(registry.insertOnce(QStringLiteral("main"), producing(std::make_shared<FakePanel>(), &calls),
                                    &inserted).ok());
    EXPECT_FALSE(inserted);

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(registry.size(), 1);

    Api::PanelHandle found;
    ASSERT_TRUE(registry.lookup(QStringLiteral("main"), found).ok());
    EXPECT_EQ(found.get(), panel.get());
}

TEST(PanelRegistryTests, LookupOfUnknownLabelIsNotFound)
{
    PanelRegistry registry;
    Api::PanelHandle found;
    const SpotlightError error = registry.lookup(QStringLiteral("ghost"), found);
    EXPECT_EQ(error.code(), SpotlightErrorCode::NotFound);
    EXPECT_FALSE(found);
}

TEST(PanelRegistryTests, ShowHideToggleOnUnknownLabelSucceed)
{
    PanelRegistry registry;
    EXPECT_TRUE(registry.show(QStringLiteral("ghost")).ok());
    EXPECT_TRUE(registry.hide(QStringLiteral("ghost")).ok());
    EXPECT_TRUE(registry.toggle(QStringLiteral("ghost")).ok());
    EXPECT_TRUE(registry.hideAll({QStringLiteral("ghost")}).ok());
    EXPECT_EQ(registry.size(), 0);
}

TEST(PanelRegistryTests, ShowAndHideOnlyCallNativeOnStateChange)
{
    PanelRegistry registry;
    auto panel = std::make_shared<FakePanel>();
    ASSERT_TRUE(registry.insertOnce(QStringLiteral("main"), producing(panel)).ok());

    EXPECT_TRUE(registry.show(QStringLiteral("main")).ok());
    EXPECT_TRUE(registry.show(QStringLiteral("main")).ok());
    EXPECT_EQ(panel->showCalls.load(), 1);

    EXPECT_TRUE(registry.hide(QStringLiteral("main")).ok());
    EXPECT_TRUE(registry.hide(QStringLiteral("main")).ok());
    EXPECT_EQ(panel->hideCalls.load(), 1);
}

TEST(PanelRegistryTests, ToggleFollowsNativeVisibility)
{
    PanelRegistry registry;
    auto panel = std::make_shared<FakePanel>();
    ASSERT_TRUE(registry.insertOnce(QStringLiteral("main"), producing(panel)).ok());

    EXPECT_TRUE(registry.toggle(QStringLiteral("main")).ok());
    EXPECT_TRUE(panel->isVisible());

    // Hidden behind the registry's back: the next toggle shows again.
    panel->visible.store(false);
    EXPECT_TRUE(registry.toggle(QStringLiteral("main")).ok());
    EXPECT_TRUE(panel->isVisible());

    EXPECT_TRUE(registry.toggle(QStringLiteral("main")).ok());
    EXPECT_FALSE(panel->isVisible());
}

TEST(PanelRegistryTests, HideAllSkipsMissingLabels)
{
    PanelRegistry registry;
    auto a = std::make_shared<FakePanel>();
    auto b = std::make_shared<FakePanel>();
    ASSERT_TRUE(registry.insertOnce(QStringLiteral("a"), producing(a)).ok());
    ASSERT_TRUE(registry.insertOnce(QStringLiteral("b"), producing(b)).ok());
    a->show();
    b->show();

    EXPECT_TRUE(registry.hideAll({QStringLiteral("a"), QStringLiteral("missing"), QStringLiteral("b")}).ok());
    EXPECT_FALSE(a->isVisible());
    EXPECT_FALSE(b->isVisible());
    EXPECT_EQ(registry.labels(), (QStringList{"a", "b"}));
}

TEST(PanelRegistryTests, FailedActivationReleasesReservation)
{
    PanelRegistry registry;
    const SpotlightError failure(SpotlightErrorCode::PanelConversion, QStringLiteral("nope"));

    bool inserted = true;
    const SpotlightError error = registry.insertOnce(
        QStringLiteral("main"), [&](Api::PanelHandle&) { return failure; }, &inserted);
    EXPECT_EQ(error.code(), SpotlightErrorCode::PanelConversion);
    EXPECT_FALSE(inserted);
    EXPECT_FALSE(registry.isPoisoned(QStringLiteral("main")));

    auto panel = std::make_shared<FakePanel>();
    EXPECT_TRUE(registry.insertOnce(QStringLiteral("main"), producing(panel), &inserted).ok());
    EXPECT_TRUE(inserted);
}

TEST(PanelRegistryTests, ThrowingActivationPoisonsLabel)
{
    PanelRegistry registry;
    auto other = std::make_shared<FakePanel>();
    ASSERT_TRUE(registry.insertOnce(QStringLiteral("other"), producing(other)).ok());

    EXPECT_THROW(registry.insertOnce(QStringLiteral("main"),
                                     [](Api::PanelHandle&) -> SpotlightError {
                                         throw std::runtime_error("boom");
                                     }),
                 std::runtime_error);

    EXPECT_TRUE(registry.isPoisoned(QStringLiteral("main")));
    EXPECT_EQ(registry.insertOnce(QStringLiteral("main"), producing(std::make_shared<FakePanel>())).code(),
              SpotlightErrorCode::Lock);

    Api::PanelHandle found;
    EXPECT_EQ(registry.lookup(QStringLiteral("main"), found).code(), SpotlightErrorCode::Lock);
    EXPECT_EQ(registry.show(QStringLiteral("main")).code(), SpotlightErrorCode::Lock);
    EXPECT_EQ(registry.hide(QStringLiteral("main")).code(), SpotlightErrorCode::Lock);
    EXPECT_EQ(registry.toggle(QStringLiteral("main")).code(), SpotlightErrorCode::Lock);
    EXPECT_EQ(registry.hideAll({QStringLiteral("main")}).code(), SpotlightErrorCode::Lock);

    EXPECT_TRUE(registry.show(QStringLiteral("other")).ok());
    EXPECT_TRUE(other->isVisible());

    EXPECT_EQ(registry.hideAll({QStringLiteral("main"), QStringLiteral("other")}).code(),
              SpotlightErrorCode::Lock);
    EXPECT_FALSE(other->isVisible());
    EXPECT_EQ(other->hideCalls.load(), 1);
}

TEST(PanelRegistryTests, ConcurrentInsertActivatesOnce)
{
    PanelRegistry registry;
    std::atomic<int> calls{0};
    std::atomic<int> insertedCount{0};
    auto panel = std::make_shared<FakePanel>();

    const PanelRegistry::Activator slow = [&](Api::PanelHandle& out) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        out = panel;
        return SpotlightError::none();
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            bool inserted = false;
            EXPECT_TRUE(registry.insertOnce(QStringLiteral("main"), slow, &inserted).ok());
            if (inserted)
                ++insertedCount;
        });
    }
    for (std::thread& t : threads)
        t.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(insertedCount.load(), 1);
    EXPECT_EQ(registry.size(), 1);
}

TEST(PanelRegistryTests, ConcurrentShowHideAcrossLabels)
{
    PanelRegistry registry;
    const QStringList labels{"a", "b", "c", "d"};
    for (const QString& label : labels)
        ASSERT_TRUE(registry.insertOnce(label, producing(std::make_shared<FakePanel>())).ok());

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            for (int n = 0; n < 200; ++n) {
                const QString& label = labels.at((i + n) % labels.size());
                EXPECT_TRUE(((n % 2) ? registry.hide(label) : registry.show(label)).ok());
                EXPECT_TRUE(registry.toggle(label).ok());
            }
        });
    }
    for (std::thread& t : threads)
        t.join();

    EXPECT_EQ(registry.size(), labels.size());
    EXPECT_TRUE(registry.hideAll(labels).ok());
    for (const QString& label : labels) {
        Api::PanelHandle panel;
        ASSERT_TRUE(registry.lookup(label, panel).ok());
        EXPECT_FALSE(panel->isVisible());
    }
}
