// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QPoint>
#include <QtCore/QSize>

#include <optional>

namespace Spotlight::Api {

struct MonitorInfo final {
    QSize size;         // physical pixels
    QPoint position;    // physical pixels
    qreal scaleFactor = 1.0;

    friend bool operator==(const MonitorInfo&, const MonitorInfo&) = default;
};

class SPOTLIGHT_EXPORT IMonitorLocator {
public:
    virtual ~IMonitorLocator() = default;

    virtual std::optional<MonitorInfo> monitorUnderPointer() const = 0;
};

} // namespace Spotlight::Api
