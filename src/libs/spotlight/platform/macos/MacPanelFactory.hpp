// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/api/IPanelFactory.hpp"

namespace Spotlight::Internal {

class MacPanelFactory final : public Api::IPanelFactory {
public:
    bool supportsPanels() const override { return true; }
    Api::PanelHandle createPanel(QWidget* window, QString* error = nullptr) override;
};

} // namespace Spotlight::Internal
