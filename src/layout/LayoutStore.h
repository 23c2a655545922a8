/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LAYOUTSTORE_H
#define LAYOUTSTORE_H

#include <QList>
#include <QObject>

#include <optional>

#include "config/WorkspaceConfig.h"
#include "layout/GridCell.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

class LayoutStorage;
class SessionRegistry;

/**
 * Ordered list of grid cells and their persistence.
 *
 * Every mutation is written through to the storage slot immediately.
 * Session ids are persisted as they are, but a loaded layout never
 * carries any: sessions do not outlive the process that created them.
 */
class TERMGRIDPRIVATE_EXPORT LayoutStore : public QObject
{
    Q_OBJECT
public:
    /** Cells are kept within this many rows; anything further is corrupt. */
    static constexpr int MaxRows = 10000;

    LayoutStore(LayoutStorage *storage, SessionRegistry *registry, const WorkspaceConfig &config, QObject *parent = nullptr);

    void load();
    bool save();

    QString addCell();
    bool removeCell(const QString &cellId);
    bool updateCellGeometry(const QString &cellId, int x, int y, int w, int h);

    QList<GridCell> cells() const;
    std::optional<GridCell> cell(const QString &cellId) const;
    int indexOf(const QString &cellId) const;
    int count() const;

public Q_SLOTS:
    void onTabsChanged(const QString &cellId, const QList<Termgrid::Tab> &tabs);

Q_SIGNALS:
    void layoutLoaded();
    void cellAdded(const Termgrid::GridCell &cell);
    void cellRemoved(const QString &cellId);
    void cellGeometryChanged(const Termgrid::GridCell &cell);

private:
    GridCell defaultCell(int x, int y) const;
    void clampSize(GridCell &cell) const;

    LayoutStorage *_storage;
    SessionRegistry *_registry;
    WorkspaceConfig _config;
    QList<GridCell> _cells;
};

} // namespace Termgrid

#endif // LAYOUTSTORE_H
