// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/api/IPanel.hpp"

#include <memory>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Spotlight::Internal {

// IPanel over the NSPanel backing a Qt::Tool widget. AppKit calls are
// forwarded to the main thread.
class MacPanel final : public Api::IPanel {
public:
    explicit MacPanel(QWidget* window);
    ~MacPanel() override;

    MacPanel(const MacPanel&) = delete;
    MacPanel& operator=(const MacPanel&) = delete;

    bool isVisible() const override;
    void show() override;
    void hide() override;

    void setLevel(int level) override;
    void setNonActivating(bool nonActivating) override;
    void setCollectionBehavior(Api::PanelCollectionBehaviors behavior) override;
    void setFocusLossHandler(FocusLossHandler handler) override;

    QSize size() const override;
    void moveTo(const QPoint& origin) override;

private:
    struct Private;
    std::unique_ptr<Private> d;
};

} // namespace Spotlight::Internal
