// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "./configuration/configuration.h"
#include "./global/ConfigConsts.h"
#include "./global/logging.h"
#include "./tiles/TileLoader.h"
#include "./tiles/TileSource.h"
#include "./viewer/MapWidget.h"

#include <memory>
#include <optional>

#include <QApplication>
#include <QCommandLineParser>
#include <QMainWindow>
#include <QStatusBar>
#include <QtCore>

namespace { // anonymous

struct NODISCARD StartupView final
{
    LonLat center;
    double zoom = 2.0;
};

NODISCARD std::optional<double> parseDouble(const QString &text)
{
    bool ok = false;
    const double value = text.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

NODISCARD StartupView parseCommandLine(const QApplication &app)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Slippy map viewer"));
    parser.addHelpOption();

    const QCommandLineOption urlOption{QStringList{QStringLiteral("u"), QStringLiteral("url")},
                                       QStringLiteral("Tile template with {z}, {x} and {y}."),
                                       QStringLiteral("template")};
    const QCommandLineOption lonOption{QStringLiteral("lon"),
                                       QStringLiteral("Initial longitude."),
                                       QStringLiteral("degrees")};
    const QCommandLineOption latOption{QStringLiteral("lat"),
                                       QStringLiteral("Initial latitude."),
                                       QStringLiteral("degrees")};
    const QCommandLineOption zoomOption{QStringLiteral("zoom"),
                                        QStringLiteral("Initial zoom level."),
                                        QStringLiteral("level")};
    const QCommandLineOption clearOption{QStringLiteral("clear-cache"),
                                         QStringLiteral("Delete the disk tile cache on start.")};
    const QCommandLineOption resetOption{QStringLiteral("reset-config"),
                                         QStringLiteral("Restore default settings.")};
    parser.addOptions({urlOption, lonOption, latOption, zoomOption, clearOption, resetOption});
    parser.process(app);

    if (parser.isSet(resetOption)) {
        setConfig().reset();
    }
    if (parser.isSet(urlOption)) {
        setConfig().source.tileUrlTemplate = parser.value(urlOption);
    }
    if (parser.isSet(clearOption)) {
        const auto &cache = getConfig().tileCache;
        DiskTileCache disk{DiskTileCache::Settings{cache.cacheDirectory,
                                                   cache.diskBudgetBytes,
                                                   cache.diskMaxAgeDays}};
        disk.clearAll();
        SMLOG_INFO() << "Cleared tile cache at " << cache.cacheDirectory;
    }

    StartupView view;
    const auto readOption = [&parser](const QCommandLineOption &option) -> std::optional<double> {
        if (!parser.isSet(option)) {
            return std::nullopt;
        }
        const auto value = parseDouble(parser.value(option));
        if (!value) {
            SMLOG_WARNING() << "Ignoring invalid --" << option.names().constFirst() << " value "
                            << parser.value(option);
        }
        return value;
    };
    view.center = LonLat::clamped(readOption(lonOption).value_or(0.0),
                                  readOption(latOption).value_or(0.0));
    view.zoom = readOption(zoomOption).value_or(view.zoom);
    return view;
}

} // namespace

int main(int argc, char **argv)
{
    setEnteredMain();
    if constexpr (IS_DEBUG_BUILD) {
        qSetMessagePattern(
            "[%{time} %{threadid}] %{type} in %{function} (at %{file}:%{line}): %{message}");
    }

    QApplication app(argc, argv);
    QApplication::setOrganizationName(QStringLiteral("SlippyMapper"));
    QApplication::setApplicationName(QStringLiteral("SlippyMapper"));

    const StartupView view = parseCommandLine(app);
    const Configuration &config = getConfig();

    RemoteTileSource::Settings remote;
    remote.userAgent = config.fetch.userAgent;
    remote.requestTimeoutMs = config.fetch.requestTimeoutMs;

    std::shared_ptr<ITileSource> source = createTileSource(config.source.tileUrlTemplate, remote);
    source->setZoomRange(config.viewport.minZoom, config.viewport.maxZoom);

    TileLoader loader{source, TileLoader::settingsFromConfig(config)};
    loader.followConfiguration(setConfig().loader);
    loader.startDrainTimer();

    auto mw = std::make_unique<QMainWindow>();
    mw->setWindowTitle(QStringLiteral("SlippyMapper"));
    auto *const map = new MapWidget(loader, config.viewport, mw.get());
    mw->setCentralWidget(map);

    Signal2Lifetime lifetime;
    map->sig_mouseMoved.connect(lifetime, [&mw](const MouseMovedEvent &event) {
        mw->statusBar()->showMessage(QStringLiteral("lon %1, lat %2")
                                         .arg(event.lonLat.lon, 0, 'f', 5)
                                         .arg(event.lonLat.lat, 0, 'f', 5));
    });
    map->sig_viewportChanged.connect(lifetime, [](const ViewportChangeEvent &event) {
        SMLOG_DEBUG() << "Viewport " << event.center << " zoom " << event.zoom;
    });

    mw->resize(1024, 768);
    map->setView(view.center, view.zoom);
    mw->show();

    const int ret = QApplication::exec();
    mw.reset();
    getConfig().write();
    return ret;
}
