// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IPanel.hpp"

#include <QtCore/QString>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Spotlight::Api {

class SPOTLIGHT_EXPORT IPanelFactory {
public:
    virtual ~IPanelFactory() = default;

    virtual bool supportsPanels() const = 0;

    // Retypes the existing native window of \a window into a panel. Never
    // creates a second window. Returns null and fills \a error on failure.
    virtual PanelHandle createPanel(QWidget* window, QString* error = nullptr) = 0;
};

} // namespace Spotlight::Api
