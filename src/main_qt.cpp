/*
 * src/main_qt.cpp - Main entry point for the Qt application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <QApplication>
#include <QCommandLineParser>
#include <QMessageBox>
#include "gui/main_window_qt.h"
#include "demoloader/config.h"

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    app.setOrganizationName("demoloader");
    app.setApplicationName("Demo Loader");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copy demo media from the CDN to a USB drive");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption catalogOption("catalog", "Catalog URL", "url");
    QCommandLineOption cdnOption("cdn", "CDN base URL", "url");
    QCommandLineOption retriesOption("retries", "Retry attempts after a network failure (0-10)", "n");
    parser.addOption(catalogOption);
    parser.addOption(cdnOption);
    parser.addOption(retriesOption);
    parser.process(app);

    demoloader::TransferConfig config;
    if (parser.isSet(catalogOption)) {
        config.catalog_url = parser.value(catalogOption).toStdString();
    }
    if (parser.isSet(cdnOption)) {
        config.cdn_base = parser.value(cdnOption).toStdString();
    }
    if (parser.isSet(retriesOption)) {
        bool ok = false;
        config.retry_attempts = parser.value(retriesOption).toInt(&ok);
        if (!ok) {
            config.retry_attempts = -1;
        }
    }

    try {
        demoloader::validate_config(config);
    } catch (const demoloader::ConfigError& e) {
        QMessageBox::critical(nullptr, "Demo Loader", QString::fromStdString(e.what()));
        return 1;
    }

    demoloader::MainWindow window(config);
    window.show();

    return app.exec();
}
