// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightGlobal.hpp"

Q_LOGGING_CATEGORY(spotlightlog, "spotlight.panels")
