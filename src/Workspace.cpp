/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Workspace.h"

#include "layout/LayoutStore.h"
#include "popout/PopoutCoordinator.h"
#include "session/SessionRegistry.h"
#include "tabs/TabController.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(TermgridLayout)

namespace Termgrid
{

Workspace::Workspace(SessionBackend *backend,
                     LayoutStorage *storage,
                     TerminalBinding::EmulationFactory emulationFactory,
                     const WorkspaceConfig &config,
                     QObject *parent)
    : QObject(parent)
    , _config(config)
    , _emulationFactory(std::move(emulationFactory))
    , _registry(new SessionRegistry(backend, this))
    , _layoutStore(new LayoutStore(storage, _registry, config, this))
    , _popoutCoordinator(new PopoutCoordinator(_registry, nullptr, this))
{
    connect(_layoutStore, &LayoutStore::layoutLoaded, this, &Workspace::rebuildControllers);
    connect(_layoutStore, &LayoutStore::cellAdded, this, &Workspace::createController);
    connect(_layoutStore, &LayoutStore::cellRemoved, this, &Workspace::destroyController);
}

Workspace::~Workspace()
{
    shutdown();

    const auto cellIds = _controllers.keys();
    for (const QString &cellId : cellIds) {
        destroyController(cellId);
    }
}

void Workspace::start()
{
    _shutDown = false;
    _layoutStore->load();
}

void Workspace::shutdown()
{
    if (_shutDown) {
        return;
    }
    _shutDown = true;

    qCInfo(TermgridLayout) << "Shutting down," << _registry->sessionCount() << "sessions still running";
    _registry->killAll();
}

QString Workspace::addCell()
{
    return _layoutStore->addCell();
}

bool Workspace::removeCell(const QString &cellId)
{
    return _layoutStore->removeCell(cellId);
}

void Workspace::setPopoutHost(PopoutHost *host)
{
    _popoutCoordinator->setHost(host);
}

TabController *Workspace::tabController(const QString &cellId) const
{
    return _controllers.value(cellId, nullptr);
}

TabHost *Workspace::tabHost(const QString &cellId) const
{
    return tabController(cellId);
}

QList<TabController *> Workspace::tabControllers() const
{
    QList<TabController *> controllers;
    const QList<GridCell> cells = _layoutStore->cells();
    for (const GridCell &cell : cells) {
        if (TabController *controller = _controllers.value(cell.id, nullptr)) {
            controllers.append(controller);
        }
    }
    return controllers;
}

SessionRegistry *Workspace::sessionRegistry() const
{
    return _registry;
}

LayoutStore *Workspace::layoutStore() const
{
    return _layoutStore;
}

PopoutCoordinator *Workspace::popoutCoordinator() const
{
    return _popoutCoordinator;
}

const WorkspaceConfig &Workspace::config() const
{
    return _config;
}

void Workspace::createController(const GridCell &cell)
{
    if (_controllers.contains(cell.id)) {
        return;
    }

    auto *controller = new TabController(cell.id, _registry, _emulationFactory, _config, this);
    controller->setPopoutCoordinator(_popoutCoordinator);
    controller->setTabs(cell.tabs);
    connect(controller, &TabController::tabsChanged, _layoutStore, &LayoutStore::onTabsChanged);

    _controllers.insert(cell.id, controller);
    Q_EMIT tabControllerAdded(controller);
}

void Workspace::destroyController(const QString &cellId)
{
    TabController *controller = _controllers.take(cellId);
    if (!controller) {
        return;
    }

    Q_EMIT tabControllerAboutToBeRemoved(controller);
    disconnect(controller, nullptr, _layoutStore, nullptr);
    delete controller;
}

void Workspace::rebuildControllers()
{
    const auto cellIds = _controllers.keys();
    for (const QString &cellId : cellIds) {
        destroyController(cellId);
    }

    const QList<GridCell> cells = _layoutStore->cells();
    for (const GridCell &cell : cells) {
        createController(cell);
    }
}

} // namespace Termgrid

#include "moc_Workspace.cpp"
