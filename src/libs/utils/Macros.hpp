// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/ScopeGuard.hpp"

#include <QtCore/QtGlobal>

// Shared guard/early-return idioms, so individual files don't grow their own.

#ifndef UTILS_GUARD_RET
#	define UTILS_GUARD_RET(cond, ret) do { if (!(cond)) return (ret); } while (false)
#endif

#define UTILS__JOIN2(a, b) a##b
#define UTILS__JOIN(a, b) UTILS__JOIN2(a, b)

#ifndef UTILS_ON_UNWIND
#	define UTILS_ON_UNWIND(...) \
		auto UTILS__JOIN(_utils_unwind_, __COUNTER__) = ::Utils::UnwindGuard([&] { __VA_ARGS__; })
#endif
