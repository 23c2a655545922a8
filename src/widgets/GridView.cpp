/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/GridView.h"

#include "Workspace.h"
#include "layout/LayoutStore.h"
#include "tabs/TabController.h"
#include "widgets/CellWidget.h"

#include <QResizeEvent>

#include <algorithm>

namespace Termgrid
{

GridView::GridView(Workspace *workspace, QWidget *parent)
    : QWidget(parent)
    , _workspace(workspace)
{
    connect(workspace, &Workspace::tabControllerAdded, this, &GridView::onControllerAdded);
    connect(workspace, &Workspace::tabControllerAboutToBeRemoved, this, &GridView::onControllerAboutToBeRemoved);
    connect(workspace->layoutStore(), &LayoutStore::cellGeometryChanged, this, [this]() {
        relayout();
    });

    const QList<TabController *> controllers = workspace->tabControllers();
    for (TabController *controller : controllers) {
        onControllerAdded(controller);
    }
}

CellWidget *GridView::cellWidget(const QString &cellId) const
{
    return _cells.value(cellId);
}

int GridView::columnWidth() const
{
    const int columns = _workspace ? std::max(1, _workspace->config().gridColumns) : 1;
    return std::max(1, width() / columns);
}

QRect GridView::cellRect(const GridCell &cell) const
{
    const int columnWidth = this->columnWidth();
    return QRect(cell.x * columnWidth, cell.y * RowHeight, cell.w * columnWidth, cell.h * RowHeight);
}

bool GridView::resizeCell(const QString &cellId, const QSize &size)
{
    if (!_workspace) {
        return false;
    }
    const std::optional<GridCell> cell = _workspace->layoutStore()->cell(cellId);
    if (!cell.has_value()) {
        return false;
    }

    const int columnWidth = this->columnWidth();
    const int w = (std::max(0, size.width()) + columnWidth / 2) / columnWidth;
    const int h = (std::max(0, size.height()) + RowHeight / 2) / RowHeight;
    // The store clamps to the grid and the minimum cell size
    return _workspace->layoutStore()->updateCellGeometry(cellId, cell->x, cell->y, w, h);
}

void GridView::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    relayout();
}

void GridView::onControllerAdded(TabController *controller)
{
    if (_cells.contains(controller->cellId())) {
        return;
    }

    auto *widget = new CellWidget(controller, this);
    connect(widget, &CellWidget::removeRequested, this, [this](const QString &cellId) {
        if (_workspace) {
            _workspace->removeCell(cellId);
        }
    });
    connect(widget, &CellWidget::resizeRequested, this, &GridView::resizeCell);
    _cells.insert(controller->cellId(), widget);
    widget->show();
    relayout();
}

void GridView::onControllerAboutToBeRemoved(TabController *controller)
{
    CellWidget *widget = _cells.take(controller->cellId());
    if (widget) {
        widget->hide();
        widget->deleteLater();
    }
    relayout();
}

void GridView::relayout()
{
    if (!_workspace) {
        return;
    }

    int bottom = 0;
    const QList<GridCell> cells = _workspace->layoutStore()->cells();
    for (const GridCell &cell : cells) {
        bottom = std::max(bottom, cell.bottom());
        CellWidget *widget = _cells.value(cell.id);
        if (widget) {
            widget->setGeometry(cellRect(cell));
        }
    }
    setMinimumHeight(bottom * RowHeight);
}

} // namespace Termgrid

#include "moc_GridView.cpp"
