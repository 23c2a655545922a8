/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TABCONTROLLER_H
#define TABCONTROLLER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>

#include <optional>

#include "config/WorkspaceConfig.h"
#include "tabs/Tab.h"
#include "tabs/TabHost.h"
#include "terminal/TerminalBinding.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

class PopoutCoordinator;
class SessionRegistry;

/**
 * Ordered tabs of one grid cell, each wrapping a TerminalBinding.
 *
 * Every change to the tab list is announced with tabsChanged(), which
 * the layout store persists.
 */
class TERMGRIDPRIVATE_EXPORT TabController : public QObject, public TabHost
{
    Q_OBJECT
public:
    TabController(const QString &cellId,
                  SessionRegistry *registry,
                  TerminalBinding::EmulationFactory emulationFactory,
                  const WorkspaceConfig &config,
                  QObject *parent = nullptr);
    ~TabController() override;

    QString cellId() const;

    QString addTab() override;
    bool closeTab(const QString &tabId) override;
    QList<Tab> tabs() const override;

    bool selectTab(const QString &tabId);
    bool renameTab(const QString &tabId, const QString &title);
    bool popout(const QString &tabId);

    /**
     * Replace all tabs with a restored list; the first one becomes active.
     * Sessions of replaced tabs are killed unless the new list attaches to them.
     */
    void setTabs(const QList<Tab> &tabs);

    /** Remove a tab without touching its session and hand it to the caller. */
    std::optional<Tab> takeTab(const QString &tabId);

    std::optional<Tab> tab(const QString &tabId) const;
    int indexOf(const QString &tabId) const;
    int count() const;
    QString activeTabId() const;

    TerminalBinding *binding(const QString &tabId) const;

    QString workingDirectory() const;
    void setPopoutCoordinator(PopoutCoordinator *coordinator);

Q_SIGNALS:
    void tabsChanged(const QString &cellId, const QList<Termgrid::Tab> &tabs);
    void tabAdded(const QString &tabId, int index);
    void tabRemoved(const QString &tabId);
    void tabRenamed(const QString &tabId, const QString &title);
    void activeTabChanged(const QString &tabId);
    void sessionExited(const QString &tabId, std::optional<int> exitCode);

private:
    TerminalBinding *createBinding(const Tab &tab);
    void removeAt(int index);
    void setActiveTab(const QString &tabId);
    void updateSessionId(const QString &tabId, const QString &sessionId);
    void notifyTabsChanged();
    QString nextTitle() const;

    QString _cellId;
    SessionRegistry *_registry;
    TerminalBinding::EmulationFactory _emulationFactory;
    WorkspaceConfig _config;
    QPointer<PopoutCoordinator> _popoutCoordinator;

    QString _workingDirectory;
    QList<Tab> _tabs;
    QHash<QString, TerminalBinding *> _bindings;
    QString _activeTabId;
};

} // namespace Termgrid

#endif // TABCONTROLLER_H
