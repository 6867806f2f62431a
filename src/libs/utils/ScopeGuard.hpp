// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <exception>
#include <utility>

namespace Utils {

// Runs only when the enclosing scope is left by a propagating exception.
template <typename F>
class UnwindGuard final {
public:
	explicit UnwindGuard(F&& f)
		: m_f(std::move(f))
		, m_exceptionsOnEntry(std::uncaught_exceptions())
	{}

	UnwindGuard(const UnwindGuard&) = delete;
	UnwindGuard& operator=(const UnwindGuard&) = delete;

	~UnwindGuard() noexcept
	{
		if (std::uncaught_exceptions() > m_exceptionsOnEntry)
			m_f();
	}

private:
	F m_f;
	int m_exceptionsOnEntry = 0;
};

} // namespace Utils
