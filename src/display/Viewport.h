#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../geo/LonLat.h"
#include "../geo/Projection.h"
#include "../geo/TileAddress.h"
#include "../global/macros.h"
#include "MapEvents.h"

#include <vector>

#include <QPointF>
#include <QRectF>
#include <QSize>

#include <glm/glm.hpp>

/// One tile the renderer has to draw, with its placement in window pixels.
struct NODISCARD VisibleTile final
{
    TileAddress address;
    /// Tiles are scaled by 2^(zoom - round(zoom)), so the rectangle is fractional.
    QRectF rect;
    /// Column before wrapping; differs from address.x for repeated worlds.
    int column = 0;
    /// True for tiles that only belong to the prefetch border.
    bool isMargin = false;
};

/// Geographic bounds of the window.
struct NODISCARD VisibleMapArea final
{
    LonLat topLeft;
    LonLat bottomRight;
    int zoom = 0;
};

/// Center, continuous zoom and window size of the map.
///
/// Every mutator clamps its input; none of them can fail.
class NODISCARD Viewport final
{
public:
    static constexpr int DEFAULT_MIN_ZOOM = 0;
    static constexpr int DEFAULT_MAX_ZOOM = 19;

private:
    LonLat m_center;
    double m_zoom = 0.0;
    QSize m_size;
    int m_minZoom = DEFAULT_MIN_ZOOM;
    int m_maxZoom = DEFAULT_MAX_ZOOM;
    int m_tileSize = projection::DEFAULT_TILE_SIZE;

public:
    Viewport() = default;
    explicit Viewport(const QSize &size, const LonLat &center = LonLat{}, double zoom = 0.0);

public:
    NODISCARD const LonLat &getCenter() const { return m_center; }
    NODISCARD double getZoom() const { return m_zoom; }
    NODISCARD const QSize &getSize() const { return m_size; }
    NODISCARD int getMinZoom() const { return m_minZoom; }
    NODISCARD int getMaxZoom() const { return m_maxZoom; }
    NODISCARD int getTileSize() const { return m_tileSize; }

    /// Integer level used to pick tiles: round(zoom).
    NODISCARD int getTileZoom() const;

public:
    void setCenter(const LonLat &center);
    void setZoom(double zoom);
    void setZoomRange(int minZoom, int maxZoom);
    void setTileSize(int tileSize);
    void resize(const QSize &size);

    /// Moves the map content by (dx, dy) window pixels, as a drag does.
    void pan(double dx, double dy);
    /// Keeps the geographic point under anchor fixed on screen.
    void zoomTo(double newZoom, const QPointF &anchor);
    void zoomBy(double delta, const QPointF &anchor);
    void zoomIn();
    void zoomOut();

public:
    NODISCARD std::vector<VisibleTile> visibleTiles(int marginTiles) const;

    NODISCARD LonLat screenToLonLat(const QPointF &screen) const;
    NODISCARD QPointF lonLatToScreen(const LonLat &lonLat) const;
    NODISCARD VisibleMapArea visibleArea() const;

    NODISCARD MouseMovedEvent mouseMovedEvent(const QPointF &screen) const;
    NODISCARD ViewportChangeEvent viewportChangeEvent() const;

private:
    NODISCARD double clampZoom(double zoom) const;
    NODISCARD glm::dvec2 centerWorldPixel() const;
    NODISCARD glm::dvec2 halfSize() const;
    NODISCARD QPointF windowCenter() const;
};
