/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CELLWIDGET_H
#define CELLWIDGET_H

#include <QPointer>
#include <QWidget>

#include "termgridprivate_export.h"

class QLineEdit;
class QTabWidget;
class QToolButton;

namespace Termgrid
{

class TabController;
class TerminalPageWidget;

/**
 * Tab widget showing the terminals of one grid cell.
 */
class TERMGRIDPRIVATE_EXPORT CellWidget : public QWidget
{
    Q_OBJECT
public:
    explicit CellWidget(TabController *controller, QWidget *parent = nullptr);

    TabController *controller() const;
    QString cellId() const;
    QTabWidget *tabWidget() const;

    /** Open an inline editor for the title of the tab at @p index. */
    QLineEdit *editTabTitle(int index);

    /** Ask the grid for a new pixel size, e.g. while the resize handle is dragged. */
    void requestResize(const QSize &size);

Q_SIGNALS:
    void removeRequested(const QString &cellId);
    void resizeRequested(const QString &cellId, const QSize &size);

protected:
    void resizeEvent(QResizeEvent *event) override;

private:
    void onTabAdded(const QString &tabId, int index);
    void onTabRemoved(const QString &tabId);
    void onTabRenamed(const QString &tabId, const QString &title);
    void onActiveTabChanged(const QString &tabId);
    void onCurrentChanged(int index);
    void startSession();
    void updateStartButton();

    int pageIndex(const QString &tabId) const;
    TerminalPageWidget *createPage(const QString &tabId);

    QPointer<TabController> _controller;
    QTabWidget *_tabWidget;
    QToolButton *_newTabButton;
    QToolButton *_popoutButton;
    QToolButton *_removeButton;
    QToolButton *_startButton;
    QWidget *_resizeHandle;
    QPointer<QLineEdit> _titleEditor;
    bool _syncing = false;
};

} // namespace Termgrid

#endif // CELLWIDGET_H
