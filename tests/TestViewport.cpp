// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TestViewport.h"

#include "../src/display/Viewport.h"

#include <cmath>
#include <set>

#include <QtTest/QtTest>

namespace { // anonymous

NODISCARD bool near(const double a, const double b, const double eps = 1e-7)
{
    return std::abs(a - b) <= eps;
}

NODISCARD Viewport makeViewport(const int w, const int h, const LonLat &center, const double zoom)
{
    return Viewport{QSize{w, h}, center, zoom};
}

// Tiles of one row must abut exactly; rows must stack exactly.
void verifyNoGapsOrOverlaps(const std::vector<VisibleTile> &tiles)
{
    for (size_t i = 1; i < tiles.size(); ++i) {
        const VisibleTile &prev = tiles[i - 1];
        const VisibleTile &cur = tiles[i];
        if (prev.address.y == cur.address.y) {
            QCOMPARE(cur.column, prev.column + 1);
            QVERIFY(near(prev.rect.right(), cur.rect.left()));
            QVERIFY(near(prev.rect.top(), cur.rect.top()));
        } else {
            QCOMPARE(cur.address.y, prev.address.y + 1);
            QVERIFY(near(prev.rect.bottom(), cur.rect.top()));
        }
    }
}

} // namespace

TestViewport::TestViewport() = default;
TestViewport::~TestViewport() = default;

void TestViewport::exampleGridTest()
{
    const Viewport vp = makeViewport(512, 512, LonLat{0.0, 0.0}, 2.0);
    const std::vector<VisibleTile> tiles = vp.visibleTiles(0);

    QCOMPARE(tiles.size(), size_t{4});
    QCOMPARE(tiles[0].address, TileAddress(2, 1, 1));
    QCOMPARE(tiles[1].address, TileAddress(2, 2, 1));
    QCOMPARE(tiles[2].address, TileAddress(2, 1, 2));
    QCOMPARE(tiles[3].address, TileAddress(2, 2, 2));

    QCOMPARE(tiles[0].rect, QRectF(0, 0, 256, 256));
    QCOMPARE(tiles[1].rect, QRectF(256, 0, 256, 256));
    QCOMPARE(tiles[2].rect, QRectF(0, 256, 256, 256));
    QCOMPARE(tiles[3].rect, QRectF(256, 256, 256, 256));

    double area = 0.0;
    for (const VisibleTile &t : tiles) {
        QVERIFY(!t.isMargin);
        area += t.rect.width() * t.rect.height();
    }
    QCOMPARE(area, 512.0 * 512.0);
    verifyNoGapsOrOverlaps(tiles);
}

void TestViewport::marginTest()
{
    const Viewport vp = makeViewport(512, 512, LonLat{0.0, 0.0}, 2.0);
    const std::vector<VisibleTile> tiles = vp.visibleTiles(1);

    QCOMPARE(tiles.size(), size_t{16});
    int margin = 0;
    for (const VisibleTile &t : tiles) {
        if (t.isMargin) {
            ++margin;
            QVERIFY(!QRectF(0, 0, 512, 512).intersects(t.rect));
        }
    }
    QCOMPARE(margin, 12);
    verifyNoGapsOrOverlaps(tiles);

    // Negative margins are treated as zero.
    QCOMPARE(vp.visibleTiles(-3).size(), size_t{4});
}

void TestViewport::fractionalZoomTest()
{
    const Viewport vp = makeViewport(800, 600, LonLat{10.0, 45.0}, 4.4);
    QCOMPARE(vp.getTileZoom(), 4);

    const std::vector<VisibleTile> tiles = vp.visibleTiles(0);
    QVERIFY(!tiles.empty());

    const double expectedSize = 256.0 * std::exp2(0.4);
    double left = 1e9;
    double top = 1e9;
    double right = -1e9;
    double bottom = -1e9;
    for (const VisibleTile &t : tiles) {
        QCOMPARE(t.address.zoom, 4);
        QVERIFY(near(t.rect.width(), expectedSize));
        QVERIFY(near(t.rect.height(), expectedSize));
        QVERIFY(t.rect.intersects(QRectF(0, 0, 800, 600)));
        left = std::min(left, t.rect.left());
        top = std::min(top, t.rect.top());
        right = std::max(right, t.rect.right());
        bottom = std::max(bottom, t.rect.bottom());
    }
    QVERIFY(left <= 0.0);
    QVERIFY(top <= 0.0);
    QVERIFY(right >= 800.0);
    QVERIFY(bottom >= 600.0);
    verifyNoGapsOrOverlaps(tiles);

    // Rounding goes up past the half.
    QCOMPARE(makeViewport(100, 100, LonLat{}, 4.5).getTileZoom(), 5);
}

void TestViewport::antimeridianRepeatTest()
{
    const Viewport vp = makeViewport(1024, 256, LonLat{0.0, 0.0}, 0.0);
    const std::vector<VisibleTile> tiles = vp.visibleTiles(0);

    QCOMPARE(tiles.size(), size_t{5});
    for (size_t i = 0; i < tiles.size(); ++i) {
        QCOMPARE(tiles[i].address, TileAddress(0, 0, 0));
        QCOMPARE(tiles[i].column, static_cast<int>(i) - 2);
    }
    verifyNoGapsOrOverlaps(tiles);

    // Near the antimeridian the columns wrap to the other edge.
    const Viewport east = makeViewport(512, 256, LonLat{179.0, 0.0}, 3.0);
    std::set<int> xs;
    for (const VisibleTile &t : east.visibleTiles(0)) {
        QVERIFY(t.address.isValid());
        xs.insert(t.address.x);
    }
    QVERIFY(xs.count(0) != 0);
    QVERIFY(xs.count(7) != 0);
}

void TestViewport::rowsOutsideWorldTest()
{
    const Viewport vp = makeViewport(256, 1024, LonLat{0.0, 0.0}, 0.0);
    const std::vector<VisibleTile> tiles = vp.visibleTiles(1);
    for (const VisibleTile &t : tiles) {
        QCOMPARE(t.address.y, 0);
        QVERIFY(t.address.isValid());
    }
    // One row, three columns (one visible plus margin on each side).
    QCOMPARE(tiles.size(), size_t{3});
}

void TestViewport::emptyWindowTest()
{
    const Viewport vp = makeViewport(0, 300, LonLat{}, 3.0);
    QVERIFY(vp.visibleTiles(1).empty());

    Viewport negative;
    negative.resize(QSize{-5, -5});
    QCOMPARE(negative.getSize(), QSize(0, 0));
    QVERIFY(negative.visibleTiles(0).empty());
}

void TestViewport::determinismTest()
{
    const Viewport a = makeViewport(733, 411, LonLat{-3.7, 40.4}, 11.37);
    const Viewport b = makeViewport(733, 411, LonLat{-3.7, 40.4}, 11.37);

    const std::vector<VisibleTile> ta = a.visibleTiles(1);
    const std::vector<VisibleTile> tb = b.visibleTiles(1);
    QCOMPARE(ta.size(), tb.size());
    for (size_t i = 0; i < ta.size(); ++i) {
        QCOMPARE(ta[i].address, tb[i].address);
        QCOMPARE(ta[i].rect, tb[i].rect);
        QCOMPARE(ta[i].column, tb[i].column);
    }
    QCOMPARE(a.visibleTiles(1).size(), ta.size());
}

void TestViewport::anchorPreservingZoomTest_data()
{
    QTest::addColumn<QPointF>("anchor");
    QTest::addColumn<double>("newZoom");

    QTest::newRow("center in") << QPointF(400, 300) << 6.0;
    QTest::newRow("corner in") << QPointF(0, 0) << 7.25;
    QTest::newRow("edge out") << QPointF(800, 150) << 3.5;
    QTest::newRow("inside out") << QPointF(123.5, 456.25) << 2.0;
    QTest::newRow("fractional") << QPointF(640, 20) << 5.01;
}

void TestViewport::anchorPreservingZoomTest()
{
    QFETCH(QPointF, anchor);
    QFETCH(double, newZoom);

    Viewport vp = makeViewport(800, 600, LonLat{10.0, 45.0}, 5.0);
    const LonLat before = vp.screenToLonLat(anchor);
    vp.zoomTo(newZoom, anchor);
    QCOMPARE(vp.getZoom(), newZoom);
    const LonLat after = vp.screenToLonLat(anchor);

    QVERIFY2(near(before.lon, after.lon), "longitude under the anchor moved");
    QVERIFY2(near(before.lat, after.lat), "latitude under the anchor moved");
}

void TestViewport::zoomClampTest()
{
    Viewport vp = makeViewport(400, 400, LonLat{}, 3.0);
    vp.setZoomRange(2, 10);

    vp.zoomTo(50.0, QPointF(200, 200));
    QCOMPARE(vp.getZoom(), 10.0);
    vp.zoomTo(-3.0, QPointF(200, 200));
    QCOMPARE(vp.getZoom(), 2.0);

    vp.setZoom(std::nan(""));
    QCOMPARE(vp.getZoom(), 2.0);

    // Inverted ranges are swapped and the zoom is re-clamped.
    vp.setZoom(9.0);
    vp.setZoomRange(5, 1);
    QCOMPARE(vp.getMinZoom(), 1);
    QCOMPARE(vp.getMaxZoom(), 5);
    QCOMPARE(vp.getZoom(), 5.0);
}

void TestViewport::zoomInOutTest()
{
    Viewport vp = makeViewport(640, 480, LonLat{2.35, 48.85}, 3.4);
    const LonLat center = vp.getCenter();

    vp.zoomIn();
    QCOMPARE(vp.getZoom(), 4.0);
    vp.zoomOut();
    QCOMPARE(vp.getZoom(), 3.0);
    vp.zoomBy(0.5, QPointF(320, 240));
    QCOMPARE(vp.getZoom(), 3.5);

    QVERIFY(near(vp.getCenter().lon, center.lon));
    QVERIFY(near(vp.getCenter().lat, center.lat));
}

void TestViewport::panTest()
{
    Viewport vp = makeViewport(512, 512, LonLat{0.0, 0.0}, 1.0);

    // Dragging right by a quarter world moves the center a quarter world west.
    vp.pan(128.0, 0.0);
    QVERIFY(near(vp.getCenter().lon, -90.0));
    QVERIFY(near(vp.getCenter().lat, 0.0));

    vp.pan(-128.0, 0.0);
    QVERIFY(near(vp.getCenter().lon, 0.0));

    // Longitude is wrapped rather than clamped.
    Viewport east = makeViewport(512, 512, LonLat{170.0, 0.0}, 2.0);
    east.pan(-(20.0 / 360.0) * projection::worldSize(2.0), 0.0);
    QVERIFY(near(east.getCenter().lon, -170.0));
    QVERIFY(east.getCenter().isValid());
}

void TestViewport::panLatitudeClampTest()
{
    Viewport vp = makeViewport(512, 512, LonLat{0.0, 0.0}, 3.0);
    vp.pan(0.0, 1e6);
    QVERIFY(vp.getCenter().lat <= MERCATOR_MAX_LATITUDE);
    QVERIFY(near(vp.getCenter().lat, MERCATOR_MAX_LATITUDE, 1e-6));

    vp.pan(0.0, -1e7);
    QVERIFY(near(vp.getCenter().lat, -MERCATOR_MAX_LATITUDE, 1e-6));

    vp.pan(std::nan(""), 0.0);
    QVERIFY(vp.getCenter().isValid());
}

void TestViewport::screenConversionTest()
{
    const Viewport vp = makeViewport(800, 600, LonLat{-0.1, 51.5}, 9.3);

    const LonLat center = vp.screenToLonLat(QPointF(400, 300));
    QVERIFY(near(center.lon, -0.1));
    QVERIFY(near(center.lat, 51.5));

    for (const QPointF &p : {QPointF(0, 0), QPointF(799, 599), QPointF(123, 456)}) {
        const QPointF back = vp.lonLatToScreen(vp.screenToLonLat(p));
        QVERIFY(near(back.x(), p.x(), 1e-6));
        QVERIFY(near(back.y(), p.y(), 1e-6));
    }

    // The copy of the world nearest to the center is used.
    const Viewport wrap = makeViewport(400, 400, LonLat{179.0, 0.0}, 4.0);
    const QPointF p = wrap.lonLatToScreen(LonLat{-179.0, 0.0});
    QVERIFY(p.x() > 200.0);
    QVERIFY(p.x() < 400.0);
}

void TestViewport::visibleAreaTest()
{
    const Viewport vp = makeViewport(512, 512, LonLat{0.0, 0.0}, 2.0);
    const VisibleMapArea area = vp.visibleArea();

    QCOMPARE(area.zoom, 2);
    QVERIFY(near(area.topLeft.lon, -90.0));
    QVERIFY(near(area.bottomRight.lon, 90.0));
    QVERIFY(near(area.topLeft.lat, 66.51326044311186, 1e-9));
    QVERIFY(near(area.bottomRight.lat, -66.51326044311186, 1e-9));
}

void TestViewport::eventsTest()
{
    const Viewport vp = makeViewport(640, 480, LonLat{24.94, 60.17}, 12.0);

    const MouseMovedEvent moved = vp.mouseMovedEvent(QPointF(320, 240));
    QCOMPARE(moved.screen, QPointF(320, 240));
    QVERIFY(near(moved.lonLat.lon, 24.94));
    QVERIFY(near(moved.lonLat.lat, 60.17));

    const ViewportChangeEvent changed = vp.viewportChangeEvent();
    QCOMPARE(changed.windowSize, QSize(640, 480));
    QCOMPARE(changed.center, vp.getCenter());
    QCOMPARE(changed.zoom, 12.0);
}

QTEST_APPLESS_MAIN(TestViewport)
