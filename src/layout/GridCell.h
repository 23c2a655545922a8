/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GRIDCELL_H
#define GRIDCELL_H

#include <QList>
#include <QMetaType>
#include <QString>

#include "tabs/Tab.h"

namespace Termgrid
{

/**
 * One panel of the workspace grid.  Position and size are in grid
 * units, not pixels.
 */
struct GridCell {
    QString id;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    QList<Tab> tabs;

    int bottom() const
    {
        return y + h;
    }

    bool operator==(const GridCell &other) const
    {
        return id == other.id && x == other.x && y == other.y && w == other.w && h == other.h && tabs == other.tabs;
    }

    bool operator!=(const GridCell &other) const
    {
        return !(*this == other);
    }
};

} // namespace Termgrid

Q_DECLARE_METATYPE(Termgrid::GridCell)

#endif // GRIDCELL_H
