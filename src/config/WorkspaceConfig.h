/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACECONFIG_H
#define WORKSPACECONFIG_H

#include <QString>

#include "termgridprivate_export.h"

class QSettings;

namespace Termgrid
{

/**
 * Tunables shared by the layout, tab and binding layers.
 *
 * Values are read from the "Workspace" group of the application's
 * QSettings; anything missing keeps its built-in default.
 */
struct TERMGRIDPRIVATE_EXPORT WorkspaceConfig {
    int minCellWidth = 2;
    int minCellHeight = 2;
    int defaultCellWidth = 6;
    int defaultCellHeight = 6;
    int gridColumns = 12;

    int initialLines = 24;
    int initialColumns = 80;

    bool autoCreateSessions = true;
    QString defaultWorkingDirectory;
    QString shellProgram;

    QString layoutKey = QStringLiteral("layout");

    static WorkspaceConfig defaults();
    static WorkspaceConfig load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace Termgrid

#endif // WORKSPACECONFIG_H
