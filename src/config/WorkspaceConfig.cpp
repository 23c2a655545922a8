/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "config/WorkspaceConfig.h"

#include <QDir>
#include <QSettings>

namespace Termgrid
{

static QString defaultShell()
{
    const QString shell = qEnvironmentVariable("SHELL");
    if (!shell.isEmpty()) {
        return shell;
    }
    return QStringLiteral("/bin/sh");
}

WorkspaceConfig WorkspaceConfig::defaults()
{
    WorkspaceConfig config;
    config.defaultWorkingDirectory = QDir::homePath();
    config.shellProgram = defaultShell();
    return config;
}

WorkspaceConfig WorkspaceConfig::load(QSettings &settings)
{
    WorkspaceConfig config = defaults();

    settings.beginGroup(QStringLiteral("Workspace"));
    config.minCellWidth = qMax(1, settings.value(QStringLiteral("MinCellWidth"), config.minCellWidth).toInt());
    config.minCellHeight = qMax(1, settings.value(QStringLiteral("MinCellHeight"), config.minCellHeight).toInt());
    config.defaultCellWidth = qMax(config.minCellWidth, settings.value(QStringLiteral("DefaultCellWidth"), config.defaultCellWidth).toInt());
    config.defaultCellHeight = qMax(config.minCellHeight, settings.value(QStringLiteral("DefaultCellHeight"), config.defaultCellHeight).toInt());
    config.gridColumns = qMax(config.defaultCellWidth, settings.value(QStringLiteral("GridColumns"), config.gridColumns).toInt());
    config.initialLines = qMax(1, settings.value(QStringLiteral("InitialLines"), config.initialLines).toInt());
    config.initialColumns = qMax(1, settings.value(QStringLiteral("InitialColumns"), config.initialColumns).toInt());
    config.autoCreateSessions = settings.value(QStringLiteral("AutoCreateSessions"), config.autoCreateSessions).toBool();
    config.defaultWorkingDirectory = settings.value(QStringLiteral("WorkingDirectory"), config.defaultWorkingDirectory).toString();
    config.shellProgram = settings.value(QStringLiteral("Shell"), config.shellProgram).toString();
    config.layoutKey = settings.value(QStringLiteral("LayoutKey"), config.layoutKey).toString();
    settings.endGroup();

    return config;
}

void WorkspaceConfig::save(QSettings &settings) const
{
    settings.beginGroup(QStringLiteral("Workspace"));
    settings.setValue(QStringLiteral("MinCellWidth"), minCellWidth);
    settings.setValue(QStringLiteral("MinCellHeight"), minCellHeight);
    settings.setValue(QStringLiteral("DefaultCellWidth"), defaultCellWidth);
    settings.setValue(QStringLiteral("DefaultCellHeight"), defaultCellHeight);
    settings.setValue(QStringLiteral("GridColumns"), gridColumns);
    settings.setValue(QStringLiteral("InitialLines"), initialLines);
    settings.setValue(QStringLiteral("InitialColumns"), initialColumns);
    settings.setValue(QStringLiteral("AutoCreateSessions"), autoCreateSessions);
    settings.setValue(QStringLiteral("WorkingDirectory"), defaultWorkingDirectory);
    settings.setValue(QStringLiteral("Shell"), shellProgram);
    settings.setValue(QStringLiteral("LayoutKey"), layoutKey);
    settings.endGroup();
}

} // namespace Termgrid
