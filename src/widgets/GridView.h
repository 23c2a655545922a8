/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GRIDVIEW_H
#define GRIDVIEW_H

#include <QHash>
#include <QPointer>
#include <QWidget>

#include "layout/GridCell.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

class CellWidget;
class TabController;
class Workspace;

/**
 * Places one CellWidget per grid cell.  Columns share the view's width
 * evenly; rows have a fixed pixel height so the view grows downwards.
 */
class TERMGRIDPRIVATE_EXPORT GridView : public QWidget
{
    Q_OBJECT
public:
    static const int RowHeight = 40;

    explicit GridView(Workspace *workspace, QWidget *parent = nullptr);

    CellWidget *cellWidget(const QString &cellId) const;
    QRect cellRect(const GridCell &cell) const;
    int columnWidth() const;

    /** Resize a cell to the grid size closest to @p size in pixels, keeping its position. */
    bool resizeCell(const QString &cellId, const QSize &size);

protected:
    void resizeEvent(QResizeEvent *event) override;

private:
    void onControllerAdded(TabController *controller);
    void onControllerAboutToBeRemoved(TabController *controller);
    void relayout();

    QPointer<Workspace> _workspace;
    QHash<QString, CellWidget *> _cells;
};

} // namespace Termgrid

#endif // GRIDVIEW_H
