#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../configuration/configuration.h"
#include "../display/MapEvents.h"
#include "../display/Viewport.h"
#include "../global/Signal2.h"
#include "../global/macros.h"

#include <optional>

#include <QPointF>
#include <QRectF>
#include <QWidget>

class QKeyEvent;
class QMouseEvent;
class QPaintEvent;
class QResizeEvent;
class QWheelEvent;
class TileLoader;

/// Draws the tiles of a TileLoader and turns mouse/keyboard input into
/// viewport changes.
class NODISCARD_QOBJECT MapWidget final : public QWidget
{
    Q_OBJECT

private:
    Viewport m_viewport;
    TileLoader &m_loader;
    int m_prefetchMargin = 1;
    std::optional<QPointF> m_dragLast;
    QRectF m_attributionRect;
    Signal2Lifetime m_lifetime;

public:
    Signal2<MouseMovedEvent> sig_mouseMoved;
    Signal2<ViewportChangeEvent> sig_viewportChanged;

public:
    explicit MapWidget(TileLoader &loader,
                       const Configuration::ViewportSettings &settings,
                       QWidget *parent);
    ~MapWidget() final;

public:
    NODISCARD const Viewport &getViewport() const { return m_viewport; }
    void setView(const LonLat &center, double zoom);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    void viewportChanged();
};
