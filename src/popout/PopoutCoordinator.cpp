/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "popout/PopoutCoordinator.h"

#include "popout/PopoutHost.h"
#include "session/SessionRegistry.h"
#include "tabs/TabController.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(TermgridPopout, "termgrid.popout", QtInfoMsg)

namespace Termgrid
{

PopoutCoordinator::PopoutCoordinator(SessionRegistry *registry, PopoutHost *host, QObject *parent)
    : QObject(parent)
    , _registry(registry)
{
    setHost(host);
}

void PopoutCoordinator::setHost(PopoutHost *host)
{
    if (_host) {
        disconnect(_host, nullptr, this, nullptr);
    }
    _host = host;
    if (_host) {
        connect(_host, &PopoutHost::popoutClosed, this, &PopoutCoordinator::onPopoutClosed);
    }
}

PopoutHost *PopoutCoordinator::host() const
{
    return _host;
}

bool PopoutCoordinator::popout(TabController *controller, const QString &tabId)
{
    if (!_host) {
        qCWarning(TermgridPopout) << "No window host, cannot pop out tab" << tabId;
        return false;
    }

    const std::optional<Tab> tab = controller->takeTab(tabId);
    if (!tab.has_value()) {
        return false;
    }

    _popouts.insert(tab->id, *tab);
    qCInfo(TermgridPopout) << "Popping out" << tab->title << "from cell" << controller->cellId() << "with session" << tab->sessionId;
    Q_EMIT tabPoppedOut(controller->cellId(), *tab);

    _host->hostTab(*tab);
    return true;
}

bool PopoutCoordinator::isPoppedOut(const QString &tabId) const
{
    return _popouts.contains(tabId);
}

QList<Tab> PopoutCoordinator::poppedOutTabs() const
{
    return _popouts.values();
}

void PopoutCoordinator::onPopoutClosed(const Tab &tab)
{
    if (!_popouts.remove(tab.id)) {
        return;
    }

    if (tab.hasSession()) {
        _registry->kill(tab.sessionId);
    }
    qCDebug(TermgridPopout) << "Popout" << tab.title << "closed";
    Q_EMIT popoutClosed(tab);
}

} // namespace Termgrid

#include "moc_PopoutCoordinator.cpp"
