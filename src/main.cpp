/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Workspace.h"
#include "config/WorkspaceConfig.h"
#include "layout/LayoutStorage.h"
#include "session/PtyBackend.h"
#include "widgets/GridView.h"
#include "widgets/PlainTextEmulation.h"
#include "widgets/PopoutWindowHost.h"

#include <QAction>
#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QMainWindow>
#include <QScrollArea>
#include <QSettings>
#include <QToolBar>

using namespace Termgrid;

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("termgrid"));
    QApplication::setOrganizationName(QStringLiteral("termgrid"));
    QApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Grid of tabbed terminal panels"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption shellOption(QStringList{QStringLiteral("s"), QStringLiteral("shell")},
                                         QStringLiteral("Shell to run in new terminals."),
                                         QStringLiteral("path"));
    const QCommandLineOption resetOption(QStringLiteral("reset-layout"), QStringLiteral("Discard the saved layout and start with a single panel."));
    parser.addOption(shellOption);
    parser.addOption(resetOption);
    parser.process(app);

    QSettings settings;
    WorkspaceConfig config = WorkspaceConfig::load(settings);
    if (parser.isSet(shellOption)) {
        config.shellProgram = parser.value(shellOption);
    }

    SettingsLayoutStorage storage(&settings, config.layoutKey);
    if (parser.isSet(resetOption)) {
        if (!storage.write(QByteArray())) {
            qWarning() << "Could not reset the saved layout";
        }
    }

    PtyBackend backend(config.shellProgram);
    const TerminalBinding::EmulationFactory factory = [](QObject *parent) -> TerminalEmulation * {
        return new PlainTextEmulation(parent);
    };

    Workspace workspace(&backend, &storage, factory, config);
    PopoutWindowHost popoutHost(workspace.sessionRegistry(), factory, config);
    workspace.setPopoutHost(&popoutHost);

    QMainWindow window;
    window.setWindowTitle(QStringLiteral("Termgrid"));

    auto *toolBar = window.addToolBar(QStringLiteral("Workspace"));
    toolBar->setMovable(false);
    QAction *addPanel = toolBar->addAction(QStringLiteral("New Panel"));
    QObject::connect(addPanel, &QAction::triggered, &workspace, [&workspace]() {
        workspace.addCell();
    });

    workspace.start();

    auto *scrollArea = new QScrollArea(&window);
    scrollArea->setWidgetResizable(true);
    scrollArea->setWidget(new GridView(&workspace));
    window.setCentralWidget(scrollArea);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &workspace, &Workspace::shutdown);

    window.resize(1200, 800);
    window.show();

    return app.exec();
}
