/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALPAGEWIDGET_H
#define TERMINALPAGEWIDGET_H

#include <QPointer>
#include <QSize>
#include <QWidget>

#include "termgridprivate_export.h"

class QFontMetrics;

namespace Termgrid
{

/**
 * A thin wrapper widget placed between a tab widget and a terminal view.
 *
 * The view always fills the page.  Whenever the page is resized the
 * available character grid is recomputed from the view's font and
 * announced with geometryChanged(), which is what terminal bindings
 * consume instead of observing widget sizes themselves.
 */
class TERMGRIDPRIVATE_EXPORT TerminalPageWidget : public QWidget
{
    Q_OBJECT

public:
    explicit TerminalPageWidget(QWidget *terminalView, QWidget *parent = nullptr);

    QWidget *terminalView() const
    {
        return _view;
    }

    /** Character grid that fits the current size, at least 1x1. */
    QSize gridSize() const
    {
        return _gridSize;
    }

    static QSize gridSizeFor(const QSize &pixels, const QFontMetrics &metrics);

Q_SIGNALS:
    void geometryChanged(int lines, int columns);

protected:
    void resizeEvent(QResizeEvent *event) override;

private:
    void layoutChild();

    QPointer<QWidget> _view;
    QSize _gridSize;
};

} // namespace Termgrid

#endif // TERMINALPAGEWIDGET_H
