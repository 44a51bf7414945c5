// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "MapWidget.h"

#include "../global/UrlUtils.h"
#include "../global/logging.h"
#include "../tiles/TileLoader.h"

#include <QColor>
#include <QFontMetricsF>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QPen>
#include <QResizeEvent>
#include <QUrl>
#include <QWheelEvent>

namespace { // anonymous

constexpr double KEY_PAN_PIXELS = 64.0;
constexpr double WHEEL_STEP_DEGREES = 120.0;

const QColor BACKGROUND_COLOR{0xdd, 0xdd, 0xdd};
const QColor PENDING_COLOR{0xee, 0xee, 0xee};
const QColor FAILED_COLOR{0xf4, 0xd0, 0xd0};

NODISCARD QString getAttributionText()
{
    return QStringLiteral("© OpenStreetMap contributors");
}

NODISCARD QUrl getAttributionUrl()
{
    return QUrl{QStringLiteral("https://www.openstreetmap.org/copyright")};
}

void drawPlaceholder(QPainter &painter, const QRectF &rect, const bool failed)
{
    painter.fillRect(rect, failed ? FAILED_COLOR : PENDING_COLOR);
    painter.setPen(QPen{BACKGROUND_COLOR, 1.0});
    painter.drawRect(rect);
    if (failed) {
        painter.drawLine(rect.topLeft(), rect.bottomRight());
        painter.drawLine(rect.topRight(), rect.bottomLeft());
    }
}

} // namespace

MapWidget::MapWidget(TileLoader &loader,
                     const Configuration::ViewportSettings &settings,
                     QWidget *const parent)
    : QWidget{parent}
    , m_loader{loader}
    , m_prefetchMargin{settings.prefetchMarginTiles}
{
    m_viewport.setZoomRange(settings.minZoom, settings.maxZoom);
    m_viewport.setTileSize(settings.tileSize);

    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(256, 256);

    m_loader.sig_tileReady.connect(m_lifetime, [this](const TileAddress &) { update(); });
    m_loader.sig_tileFailed.connect(m_lifetime,
                                    [this](const TileAddress &addr, const TileError &error) {
                                        SMLOG_DEBUG() << "Tile " << addr << " unavailable: "
                                                      << error.message;
                                        update();
                                    });
}

MapWidget::~MapWidget() = default;

void MapWidget::setView(const LonLat &center, const double zoom)
{
    m_viewport.setCenter(center);
    m_viewport.setZoom(zoom);
    viewportChanged();
}

void MapWidget::viewportChanged()
{
    m_loader.updateVisibleTiles(m_viewport.visibleTiles(m_prefetchMargin));
    sig_viewportChanged.invoke(m_viewport.viewportChangeEvent());
    update();
}

void MapWidget::paintEvent(QPaintEvent *const /*event*/)
{
    QPainter painter{this};
    painter.fillRect(rect(), BACKGROUND_COLOR);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    for (const VisibleTile &tile : m_viewport.visibleTiles(0)) {
        const TileLookup lookup = m_loader.getOrSchedule(tile.address);
        switch (lookup.status) {
        case TileStatusEnum::READY:
            painter.drawImage(tile.rect, lookup.image);
            break;
        case TileStatusEnum::PENDING:
            drawPlaceholder(painter, tile.rect, false);
            break;
        case TileStatusEnum::FAILED:
            drawPlaceholder(painter, tile.rect, true);
            break;
        }
    }

    const QString text = getAttributionText();
    const QFontMetricsF metrics{painter.font()};
    const QSizeF textSize = metrics.size(Qt::TextSingleLine, text) + QSizeF{8.0, 4.0};
    m_attributionRect = QRectF{QPointF{width() - textSize.width(), height() - textSize.height()},
                               textSize};
    painter.fillRect(m_attributionRect, QColor{255, 255, 255, 192});
    painter.setPen(Qt::black);
    painter.drawText(m_attributionRect, Qt::AlignCenter, text);
}

void MapWidget::resizeEvent(QResizeEvent *const event)
{
    m_viewport.resize(event->size());
    viewportChanged();
}

void MapWidget::mousePressEvent(QMouseEvent *const event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    if (m_attributionRect.contains(event->position())) {
        smqt::openUrl(getAttributionUrl());
        return;
    }
    m_dragLast = event->position();
    setCursor(Qt::ClosedHandCursor);
}

void MapWidget::mouseMoveEvent(QMouseEvent *const event)
{
    const QPointF pos = event->position();
    if (m_dragLast) {
        const QPointF delta = pos - *m_dragLast;
        m_dragLast = pos;
        m_viewport.pan(delta.x(), delta.y());
        viewportChanged();
    }
    sig_mouseMoved.invoke(m_viewport.mouseMovedEvent(pos));
}

void MapWidget::mouseReleaseEvent(QMouseEvent *const event)
{
    if (event->button() == Qt::LeftButton && m_dragLast) {
        m_dragLast.reset();
        unsetCursor();
    }
}

void MapWidget::wheelEvent(QWheelEvent *const event)
{
    const double steps = static_cast<double>(event->angleDelta().y()) / WHEEL_STEP_DEGREES;
    if (steps == 0.0) {
        return;
    }
    m_viewport.zoomBy(steps, event->position());
    viewportChanged();
    event->accept();
}

void MapWidget::keyPressEvent(QKeyEvent *const event)
{
    switch (event->key()) {
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        m_viewport.zoomIn();
        break;
    case Qt::Key_Minus:
        m_viewport.zoomOut();
        break;
    case Qt::Key_Left:
        m_viewport.pan(KEY_PAN_PIXELS, 0.0);
        break;
    case Qt::Key_Right:
        m_viewport.pan(-KEY_PAN_PIXELS, 0.0);
        break;
    case Qt::Key_Up:
        m_viewport.pan(0.0, KEY_PAN_PIXELS);
        break;
    case Qt::Key_Down:
        m_viewport.pan(0.0, -KEY_PAN_PIXELS);
        break;
    default:
        QWidget::keyPressEvent(event);
        return;
    }
    viewportChanged();
}
