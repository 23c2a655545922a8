/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACE_H
#define WORKSPACE_H

#include <QHash>
#include <QList>
#include <QObject>

#include "config/WorkspaceConfig.h"
#include "layout/GridCell.h"
#include "terminal/TerminalBinding.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

class LayoutStorage;
class LayoutStore;
class PopoutCoordinator;
class PopoutHost;
class SessionBackend;
class SessionRegistry;
class TabController;
class TabHost;

/**
 * Owns the session registry, the layout store, the popout coordinator
 * and one TabController per grid cell.
 *
 * The backend and the storage slot are not owned and must outlive the
 * workspace.  shutdown() (also run by the destructor) kills every
 * session that is still alive.
 */
class TERMGRIDPRIVATE_EXPORT Workspace : public QObject
{
    Q_OBJECT
public:
    Workspace(SessionBackend *backend,
              LayoutStorage *storage,
              TerminalBinding::EmulationFactory emulationFactory,
              const WorkspaceConfig &config,
              QObject *parent = nullptr);
    ~Workspace() override;

    /** Load the persisted layout and create a controller for every cell. */
    void start();
    void shutdown();

    QString addCell();
    bool removeCell(const QString &cellId);

    void setPopoutHost(PopoutHost *host);

    TabController *tabController(const QString &cellId) const;
    TabHost *tabHost(const QString &cellId) const;
    QList<TabController *> tabControllers() const;

    SessionRegistry *sessionRegistry() const;
    LayoutStore *layoutStore() const;
    PopoutCoordinator *popoutCoordinator() const;
    const WorkspaceConfig &config() const;

Q_SIGNALS:
    void tabControllerAdded(Termgrid::TabController *controller);
    void tabControllerAboutToBeRemoved(Termgrid::TabController *controller);

private:
    void createController(const GridCell &cell);
    void destroyController(const QString &cellId);
    void rebuildControllers();

    WorkspaceConfig _config;
    TerminalBinding::EmulationFactory _emulationFactory;

    SessionRegistry *_registry;
    LayoutStore *_layoutStore;
    PopoutCoordinator *_popoutCoordinator;

    QHash<QString, TabController *> _controllers;
    bool _shutDown = false;
};

} // namespace Termgrid

#endif // WORKSPACE_H
