// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TestDiskTileCache.h"

#include "../src/tiles/DiskTileCache.h"
#include "../src/tiles/TileCache.h"
#include "FakeTileSource.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest/QtTest>

namespace { // anonymous

NODISCARD TileKey key(const int x, const QString &source = QStringLiteral("osm-0123456789ab"))
{
    return TileKey{TileSourceId{source}, TileAddress{3, x, 5}};
}

NODISCARD DiskTileCache::Settings settingsFor(const QTemporaryDir &dir,
                                              const qint64 budget = 1024 * 1024,
                                              const int maxAgeDays = 30)
{
    return DiskTileCache::Settings{dir.path(), budget, maxAgeDays};
}

void setAge(const QString &path, const QDateTime &when)
{
    QFile file{path};
    QVERIFY(file.open(QIODevice::ReadWrite));
    QVERIFY(file.setFileTime(when, QFileDevice::FileModificationTime));
}

} // namespace

TestDiskTileCache::TestDiskTileCache() = default;
TestDiskTileCache::~TestDiskTileCache() = default;

void TestDiskTileCache::pathLayoutTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const DiskTileCache disk{settingsFor(dir)};

    QCOMPARE(disk.pathFor(TileKey{TileSourceId{QStringLiteral("osm-abc")}, TileAddress{3, 4, 5}}),
             dir.path() + QStringLiteral("/osm-abc/3/4/5.tile"));
}

void TestDiskTileCache::writeReadTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DiskTileCache disk{settingsFor(dir)};

    QVERIFY(!disk.read(key(1)).has_value());

    const QByteArray bytes = FakeTileSource::makePng();
    QVERIFY(disk.write(key(1), bytes));
    QVERIFY(QFileInfo::exists(disk.pathFor(key(1))));

    const auto read = disk.read(key(1));
    QVERIFY(read.has_value());
    QCOMPARE(*read, bytes);
    QCOMPARE(disk.getBytesUsed(), static_cast<qint64>(bytes.size()));

    QVERIFY(disk.remove(key(1)));
    QVERIFY(!disk.read(key(1)).has_value());
    QCOMPARE(disk.getBytesUsed(), qint64{0});
}

void TestDiskTileCache::persistenceTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    {
        DiskTileCache disk{settingsFor(dir)};
        QVERIFY(disk.write(key(2), QByteArrayLiteral("tile-two")));
    }
    const DiskTileCache reopened{settingsFor(dir)};
    const auto read = reopened.read(key(2));
    QVERIFY(read.has_value());
    QCOMPARE(*read, QByteArrayLiteral("tile-two"));
}

void TestDiskTileCache::separateSourcesTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DiskTileCache disk{settingsFor(dir)};

    const TileKey a = key(1, QStringLiteral("a-000000000000"));
    const TileKey b = key(1, QStringLiteral("b-000000000000"));
    QVERIFY(disk.pathFor(a) != disk.pathFor(b));

    QVERIFY(disk.write(a, QByteArrayLiteral("from a")));
    QVERIFY(disk.write(b, QByteArrayLiteral("from b")));
    QCOMPARE(*disk.read(a), QByteArrayLiteral("from a"));
    QCOMPARE(*disk.read(b), QByteArrayLiteral("from b"));
}

void TestDiskTileCache::expiryTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DiskTileCache disk{settingsFor(dir, 1024 * 1024, 30)};

    QVERIFY(disk.write(key(1), QByteArrayLiteral("old")));
    const QString path = disk.pathFor(key(1));
    setAge(path, QDateTime::currentDateTimeUtc().addDays(-40));

    QVERIFY(!disk.read(key(1)).has_value());
    QVERIFY(!QFileInfo::exists(path));
}

void TestDiskTileCache::readRefreshesAgeTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DiskTileCache disk{settingsFor(dir)};

    QVERIFY(disk.write(key(1), QByteArrayLiteral("aging")));
    const QString path = disk.pathFor(key(1));
    const QDateTime old = QDateTime::currentDateTimeUtc().addDays(-10);
    setAge(path, old);

    QVERIFY(disk.read(key(1)).has_value());
    QVERIFY(QFileInfo{path}.lastModified().toUTC() > old.addDays(9));
}

void TestDiskTileCache::budgetEvictionTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DiskTileCache disk{settingsFor(dir, 2500)};

    const QByteArray kilo(1000, 'x');
    const QDateTime now = QDateTime::currentDateTimeUtc();

    QVERIFY(disk.write(key(1), kilo));
    setAge(disk.pathFor(key(1)), now.addSecs(-3 * 3600));
    QVERIFY(disk.write(key(2), kilo));
    setAge(disk.pathFor(key(2)), now.addSecs(-2 * 3600));

    // The third write goes over budget; the oldest file has to go.
    QVERIFY(disk.write(key(3), kilo));

    QVERIFY(!QFileInfo::exists(disk.pathFor(key(1))));
    QVERIFY(QFileInfo::exists(disk.pathFor(key(2))));
    QVERIFY(QFileInfo::exists(disk.pathFor(key(3))));
    QVERIFY(disk.getBytesUsed() <= 2500);
}

void TestDiskTileCache::clearTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    DiskTileCache disk{settingsFor(dir)};

    const TileSourceId a{QStringLiteral("a-000000000000")};
    const TileSourceId b{QStringLiteral("b-000000000000")};
    QVERIFY(disk.write(TileKey{a, TileAddress{1, 0, 0}}, QByteArrayLiteral("a")));
    QVERIFY(disk.write(TileKey{b, TileAddress{1, 0, 0}}, QByteArrayLiteral("b")));

    disk.clear(a);
    QVERIFY(!disk.read(TileKey{a, TileAddress{1, 0, 0}}).has_value());
    QVERIFY(disk.read(TileKey{b, TileAddress{1, 0, 0}}).has_value());

    disk.clearAll();
    QVERIFY(!disk.read(TileKey{b, TileAddress{1, 0, 0}}).has_value());
    QCOMPARE(disk.getBytesUsed(), qint64{0});
    QVERIFY(QFileInfo{dir.path()}.isDir());
}

void TestDiskTileCache::twoTierTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    TileCache::Settings settings;
    settings.memoryBudgetBytes = 1024 * 1024;
    settings.disk = settingsFor(dir);

    const QByteArray png = FakeTileSource::makePng(Qt::blue);
    const QImage image = *decodeTileImage(png);
    {
        TileCache cache{settings};
        cache.put(key(1), image, png);
        QVERIFY(cache.lookupMemory(key(1)).has_value());
        QVERIFY(cache.get(key(1)).has_value());
    }

    // A cold cache finds the tile on disk and promotes it.
    TileCache cold{settings};
    QVERIFY(!cold.lookupMemory(key(1)).has_value());
    const auto fromDisk = cold.get(key(1));
    QVERIFY(fromDisk.has_value());
    QCOMPARE(fromDisk->pixelColor(0, 0), QColor(Qt::blue));
    QVERIFY(cold.lookupMemory(key(1)).has_value());

    // Repeated gets keep returning the same pixels.
    QCOMPARE(*cold.get(key(1)), *fromDisk);
}

void TestDiskTileCache::twoTierCorruptTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    TileCache::Settings settings;
    settings.disk = settingsFor(dir);
    TileCache cache{settings};

    QVERIFY(cache.getDisk().write(key(1), QByteArrayLiteral("not an image")));
    QVERIFY(!cache.get(key(1)).has_value());
    QVERIFY(!QFileInfo::exists(cache.getDisk().pathFor(key(1))));
    QVERIFY(!decodeTileImage(QByteArray()).has_value());
}

void TestDiskTileCache::diskOnlyAccessTest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    TileCache::Settings settings;
    settings.disk = settingsFor(dir);
    TileCache cache{settings};

    QVERIFY(!cache.loadFromDisk(key(1)).has_value());

    QVERIFY(cache.storeOnDisk(key(1), FakeTileSource::makePng(Qt::red)));
    QVERIFY(QFileInfo::exists(cache.getDisk().pathFor(key(1))));
    QCOMPARE(cache.getMemory().size(), size_t{0});

    const auto image = cache.loadFromDisk(key(1));
    QVERIFY(image.has_value());
    QCOMPARE(image->pixelColor(0, 0), QColor(Qt::red));
    QCOMPARE(cache.getMemory().size(), size_t{0});
    QCOMPARE(cache.getMemory().getStats().hits, uint64_t{0});
    QCOMPARE(cache.getMemory().getStats().misses, uint64_t{0});

    QVERIFY(cache.storeOnDisk(key(2), QByteArrayLiteral("garbage")));
    QVERIFY(!cache.loadFromDisk(key(2)).has_value());
    QVERIFY(!QFileInfo::exists(cache.getDisk().pathFor(key(2))));
}

QTEST_GUILESS_MAIN(TestDiskTileCache)
