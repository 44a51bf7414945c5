// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "Viewport.h"

#include "../global/utils.h"

#include <algorithm>
#include <cmath>

Viewport::Viewport(const QSize &size, const LonLat &center, const double zoom)
{
    resize(size);
    setCenter(center);
    setZoom(zoom);
}

int Viewport::getTileZoom() const
{
    const int z = static_cast<int>(std::lround(m_zoom));
    return std::clamp(z, m_minZoom, m_maxZoom);
}

double Viewport::clampZoom(const double zoom) const
{
    if (!std::isfinite(zoom)) {
        return static_cast<double>(m_minZoom);
    }
    return std::clamp(zoom, static_cast<double>(m_minZoom), static_cast<double>(m_maxZoom));
}

void Viewport::setCenter(const LonLat &center)
{
    m_center = LonLat::clamped(center.lon, center.lat);
}

void Viewport::setZoom(const double zoom)
{
    m_zoom = clampZoom(zoom);
}

void Viewport::setZoomRange(int minZoom, int maxZoom)
{
    minZoom = projection::clampZoomLevel(minZoom);
    maxZoom = projection::clampZoomLevel(maxZoom);
    if (maxZoom < minZoom) {
        std::swap(minZoom, maxZoom);
    }
    m_minZoom = minZoom;
    m_maxZoom = maxZoom;
    m_zoom = clampZoom(m_zoom);
}

void Viewport::setTileSize(const int tileSize)
{
    m_tileSize = std::max(1, tileSize);
}

void Viewport::resize(const QSize &size)
{
    m_size = QSize{std::max(0, size.width()), std::max(0, size.height())};
}

glm::dvec2 Viewport::centerWorldPixel() const
{
    return projection::geoToWorldPixel(m_center, m_zoom, m_tileSize);
}

glm::dvec2 Viewport::halfSize() const
{
    return glm::dvec2{m_size.width(), m_size.height()} * 0.5;
}

QPointF Viewport::windowCenter() const
{
    const glm::dvec2 half = halfSize();
    return QPointF{half.x, half.y};
}

void Viewport::pan(const double dx, const double dy)
{
    if (!std::isfinite(dx) || !std::isfinite(dy)) {
        return;
    }
    const glm::dvec2 world = centerWorldPixel() - glm::dvec2{dx, dy};
    m_center = projection::worldPixelToGeo(world, m_zoom, m_tileSize);
}

void Viewport::zoomTo(const double newZoom, const QPointF &anchor)
{
    const double target = clampZoom(newZoom);
    if (target == m_zoom) {
        return;
    }

    const glm::dvec2 offset = glm::dvec2{anchor.x(), anchor.y()} - halfSize();
    const glm::dvec2 anchorWorld = centerWorldPixel() + offset;

    const double scale = std::exp2(target - m_zoom);
    const glm::dvec2 newCenterWorld = anchorWorld * scale - offset;

    m_zoom = target;
    m_center = projection::worldPixelToGeo(newCenterWorld, m_zoom, m_tileSize);
}

void Viewport::zoomBy(const double delta, const QPointF &anchor)
{
    zoomTo(m_zoom + delta, anchor);
}

void Viewport::zoomIn()
{
    zoomTo(std::floor(m_zoom) + 1.0, windowCenter());
}

void Viewport::zoomOut()
{
    zoomTo(std::ceil(m_zoom) - 1.0, windowCenter());
}

std::vector<VisibleTile> Viewport::visibleTiles(int marginTiles) const
{
    std::vector<VisibleTile> result;
    if (m_size.isEmpty()) {
        return result;
    }

    marginTiles = std::max(0, marginTiles);

    const int z = getTileZoom();
    const int n = TileAddress::tileCount(z);
    const double scale = std::exp2(m_zoom - static_cast<double>(z));
    const double ts = static_cast<double>(m_tileSize);
    const double drawSize = ts * scale;

    // Window rectangle in world pixels of level z.
    const glm::dvec2 center = projection::geoToWorldPixel(m_center, z, m_tileSize);
    const glm::dvec2 half = halfSize() / scale;
    const glm::dvec2 topLeft = center - half;
    const glm::dvec2 bottomRight = center + half;

    const int firstCol = static_cast<int>(std::floor(topLeft.x / ts));
    const int lastCol = static_cast<int>(std::ceil(bottomRight.x / ts)) - 1;
    const int firstRow = static_cast<int>(std::floor(topLeft.y / ts));
    const int lastRow = static_cast<int>(std::ceil(bottomRight.y / ts)) - 1;

    const double originX = halfSize().x - center.x * scale;
    const double originY = halfSize().y - center.y * scale;

    for (int row = firstRow - marginTiles; row <= lastRow + marginTiles; ++row) {
        if (row < 0 || row >= n) {
            continue;
        }
        const bool marginRow = row < firstRow || row > lastRow;
        for (int col = firstCol - marginTiles; col <= lastCol + marginTiles; ++col) {
            VisibleTile tile;
            tile.address = TileAddress{z, utils::floorMod(col, n), row};
            tile.column = col;
            tile.isMargin = marginRow || col < firstCol || col > lastCol;
            tile.rect = QRectF{originX + static_cast<double>(col) * drawSize,
                               originY + static_cast<double>(row) * drawSize,
                               drawSize,
                               drawSize};
            result.emplace_back(tile);
        }
    }
    return result;
}

LonLat Viewport::screenToLonLat(const QPointF &screen) const
{
    const glm::dvec2 offset = glm::dvec2{screen.x(), screen.y()} - halfSize();
    return projection::worldPixelToGeo(centerWorldPixel() + offset, m_zoom, m_tileSize);
}

QPointF Viewport::lonLatToScreen(const LonLat &lonLat) const
{
    const double size = projection::worldSize(m_zoom, m_tileSize);
    glm::dvec2 delta = projection::geoToWorldPixel(lonLat, m_zoom, m_tileSize)
                       - centerWorldPixel();
    // Pick the copy of the world nearest to the center.
    delta.x = utils::floorMod(delta.x + size * 0.5, size) - size * 0.5;
    const glm::dvec2 screen = delta + halfSize();
    return QPointF{screen.x, screen.y};
}

VisibleMapArea Viewport::visibleArea() const
{
    VisibleMapArea area;
    area.topLeft = screenToLonLat(QPointF{0.0, 0.0});
    area.bottomRight = screenToLonLat(QPointF{static_cast<double>(m_size.width()),
                                              static_cast<double>(m_size.height())});
    area.zoom = getTileZoom();
    return area;
}

MouseMovedEvent Viewport::mouseMovedEvent(const QPointF &screen) const
{
    return MouseMovedEvent{screen, screenToLonLat(screen)};
}

ViewportChangeEvent Viewport::viewportChangeEvent() const
{
    return ViewportChangeEvent{m_size, m_center, m_zoom};
}
