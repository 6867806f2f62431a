// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include <utils/Macros.hpp>

#include <stdexcept>

namespace {

void runWithUnwindFlag(bool shouldThrow, bool& unwound)
{
    UTILS_ON_UNWIND(unwound = true);
    if (shouldThrow)
        throw std::runtime_error("unwind");
}

} // namespace

TEST(ScopeGuardTests, UnwindGuardRunsOnlyWhenThrowing)
{
    bool unwound = false;
    runWithUnwindFlag(false, unwound);
    EXPECT_FALSE(unwound);

    EXPECT_THROW(runWithUnwindFlag(true, unwound), std::runtime_error);
    EXPECT_TRUE(unwound);
}

TEST(ScopeGuardTests, UnwindGuardInsideDestructorDuringUnwindStaysQuiet)
{
    struct Probe {
        bool* unwound;
        ~Probe() { runWithUnwindFlag(false, *unwound); }
    };

    bool unwound = false;
    try {
        Probe probe{&unwound};
        throw std::runtime_error("outer");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(unwound);
}
