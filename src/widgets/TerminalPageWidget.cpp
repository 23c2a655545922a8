/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/TerminalPageWidget.h"

#include <QFontMetrics>
#include <QResizeEvent>

namespace Termgrid
{

TerminalPageWidget::TerminalPageWidget(QWidget *terminalView, QWidget *parent)
    : QWidget(parent)
    , _view(terminalView)
{
    if (_view) {
        _view->setParent(this);
        _view->show();
    }
    layoutChild();
}

QSize TerminalPageWidget::gridSizeFor(const QSize &pixels, const QFontMetrics &metrics)
{
    const int cellWidth = qMax(1, metrics.horizontalAdvance(QLatin1Char('M')));
    const int cellHeight = qMax(1, metrics.lineSpacing());
    return QSize(qMax(1, pixels.width() / cellWidth), qMax(1, pixels.height() / cellHeight));
}

void TerminalPageWidget::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    layoutChild();
}

void TerminalPageWidget::layoutChild()
{
    if (!_view) {
        return;
    }

    _view->setGeometry(0, 0, width(), height());

    const QSize grid = gridSizeFor(size(), _view->fontMetrics());
    if (grid != _gridSize) {
        _gridSize = grid;
        Q_EMIT geometryChanged(grid.height(), grid.width());
    }
}

} // namespace Termgrid

#include "moc_TerminalPageWidget.cpp"
