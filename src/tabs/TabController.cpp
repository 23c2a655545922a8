/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "tabs/TabController.h"

#include "popout/PopoutCoordinator.h"
#include "session/SessionRegistry.h"

#include <QLoggingCategory>
#include <QSet>
#include <QTimer>
#include <QUuid>

#include <utility>

Q_LOGGING_CATEGORY(TermgridTabs, "termgrid.tabs", QtInfoMsg)

namespace Termgrid
{

TabController::TabController(const QString &cellId,
                             SessionRegistry *registry,
                             TerminalBinding::EmulationFactory emulationFactory,
                             const WorkspaceConfig &config,
                             QObject *parent)
    : QObject(parent)
    , _cellId(cellId)
    , _registry(registry)
    , _emulationFactory(std::move(emulationFactory))
    , _config(config)
    , _workingDirectory(config.defaultWorkingDirectory)
{
}

TabController::~TabController() = default;

QString TabController::cellId() const
{
    return _cellId;
}

QString TabController::nextTitle() const
{
    return QStringLiteral("Terminal %1").arg(_tabs.size() + 1);
}

QString TabController::addTab()
{
    Tab tab;
    tab.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    tab.title = nextTitle();
    tab.workingDirectory = _workingDirectory;

    _tabs.append(tab);
    TerminalBinding *binding = createBinding(tab);

    qCDebug(TermgridTabs) << "Cell" << _cellId << "added" << tab.title << tab.id;
    Q_EMIT tabAdded(tab.id, _tabs.size() - 1);
    setActiveTab(tab.id);
    notifyTabsChanged();

    // Focus once the new page has been laid out and painted
    QTimer::singleShot(0, binding, [binding]() {
        binding->requestFocus();
    });

    return tab.id;
}

bool TabController::closeTab(const QString &tabId)
{
    const int index = indexOf(tabId);
    if (index < 0) {
        return false;
    }

    const Tab &tab = _tabs.at(index);
    if (tab.hasSession()) {
        // Fire and forget; the registry logs a failed kill
        _registry->kill(tab.sessionId);
    }

    qCDebug(TermgridTabs) << "Cell" << _cellId << "closed" << tab.title << tabId;
    removeAt(index);
    notifyTabsChanged();
    return true;
}

QList<Tab> TabController::tabs() const
{
    return _tabs;
}

bool TabController::selectTab(const QString &tabId)
{
    TerminalBinding *tabBinding = _bindings.value(tabId, nullptr);
    if (!tabBinding) {
        return false;
    }

    setActiveTab(tabId);
    tabBinding->requestFocus();
    return true;
}

bool TabController::renameTab(const QString &tabId, const QString &title)
{
    const int index = indexOf(tabId);
    if (index < 0 || title.isEmpty()) {
        return false;
    }
    if (_tabs[index].title == title) {
        return true;
    }

    _tabs[index].title = title;
    Q_EMIT tabRenamed(tabId, title);
    notifyTabsChanged();
    return true;
}

bool TabController::popout(const QString &tabId)
{
    if (!_popoutCoordinator || indexOf(tabId) < 0) {
        return false;
    }
    return _popoutCoordinator->popout(this, tabId);
}

void TabController::setTabs(const QList<Tab> &tabs)
{
    QSet<QString> attached;
    for (const Tab &newTab : tabs) {
        if (newTab.hasSession()) {
            attached.insert(newTab.sessionId);
        }
    }

    const auto bindings = _bindings;
    for (TerminalBinding *oldBinding : bindings) {
        disconnect(oldBinding, nullptr, this, nullptr);
        const QString sessionId = oldBinding->release();
        // Only sessions the new list attaches to stay alive
        if (!sessionId.isEmpty() && !attached.contains(sessionId)) {
            _registry->kill(sessionId);
        }
        oldBinding->deleteLater();
    }
    _bindings.clear();
    for (const Tab &oldTab : std::as_const(_tabs)) {
        Q_EMIT tabRemoved(oldTab.id);
    }

    _tabs = tabs;
    _activeTabId.clear();

    if (!_tabs.isEmpty() && !_tabs.first().workingDirectory.isEmpty()) {
        _workingDirectory = _tabs.first().workingDirectory;
    }

    for (int i = 0; i < _tabs.size(); ++i) {
        createBinding(_tabs.at(i));
        Q_EMIT tabAdded(_tabs.at(i).id, i);
    }

    setActiveTab(_tabs.isEmpty() ? QString() : _tabs.first().id);
}

std::optional<Tab> TabController::takeTab(const QString &tabId)
{
    const int index = indexOf(tabId);
    if (index < 0) {
        return std::nullopt;
    }

    Tab tab = _tabs.at(index);
    qCDebug(TermgridTabs) << "Cell" << _cellId << "released" << tab.title << "with session" << tab.sessionId;
    removeAt(index);
    notifyTabsChanged();
    return tab;
}

std::optional<Tab> TabController::tab(const QString &tabId) const
{
    const int index = indexOf(tabId);
    if (index < 0) {
        return std::nullopt;
    }
    return _tabs.at(index);
}

int TabController::indexOf(const QString &tabId) const
{
    for (int i = 0; i < _tabs.size(); ++i) {
        if (_tabs.at(i).id == tabId) {
            return i;
        }
    }
    return -1;
}

int TabController::count() const
{
    return _tabs.size();
}

QString TabController::activeTabId() const
{
    return _activeTabId;
}

TerminalBinding *TabController::binding(const QString &tabId) const
{
    return _bindings.value(tabId, nullptr);
}

QString TabController::workingDirectory() const
{
    return _workingDirectory;
}

void TabController::setPopoutCoordinator(PopoutCoordinator *coordinator)
{
    _popoutCoordinator = coordinator;
}

TerminalBinding *TabController::createBinding(const Tab &tab)
{
    TerminalBinding::Options options;
    options.autoCreate = _config.autoCreateSessions;
    options.workingDirectory = tab.workingDirectory;
    options.sessionId = tab.sessionId;

    auto *tabBinding = new TerminalBinding(_registry, _emulationFactory, options, this);
    const QString tabId = tab.id;

    connect(tabBinding, &TerminalBinding::bound, this, [this, tabId](const QString &sessionId) {
        updateSessionId(tabId, sessionId);
    });
    connect(tabBinding, &TerminalBinding::sessionExited, this, [this, tabId](const QString &, std::optional<int> exitCode) {
        updateSessionId(tabId, QString());
        Q_EMIT sessionExited(tabId, exitCode);
    });
    connect(tabBinding, &TerminalBinding::spawnFailed, this, [this, tabId](const QString &message) {
        qCWarning(TermgridTabs) << "Cell" << _cellId << "tab" << tabId << "has no session:" << message;
    });

    _bindings.insert(tabId, tabBinding);
    tabBinding->mount(_config.initialLines, _config.initialColumns);
    return tabBinding;
}

void TabController::removeAt(int index)
{
    const QString tabId = _tabs.at(index).id;
    const bool wasActive = tabId == _activeTabId;

    if (TerminalBinding *tabBinding = _bindings.take(tabId)) {
        disconnect(tabBinding, nullptr, this, nullptr);
        tabBinding->release();
        tabBinding->deleteLater();
    }

    _tabs.removeAt(index);
    Q_EMIT tabRemoved(tabId);

    if (wasActive) {
        if (_tabs.isEmpty()) {
            setActiveTab(QString());
        } else {
            setActiveTab(_tabs.at(qMin(index, _tabs.size() - 1)).id);
        }
    }
}

void TabController::setActiveTab(const QString &tabId)
{
    if (_activeTabId == tabId) {
        return;
    }
    _activeTabId = tabId;
    Q_EMIT activeTabChanged(tabId);
}

void TabController::updateSessionId(const QString &tabId, const QString &sessionId)
{
    const int index = indexOf(tabId);
    if (index < 0 || _tabs[index].sessionId == sessionId) {
        return;
    }
    _tabs[index].sessionId = sessionId;
    notifyTabsChanged();
}

void TabController::notifyTabsChanged()
{
    Q_EMIT tabsChanged(_cellId, _tabs);
}

} // namespace Termgrid

#include "moc_TabController.cpp"
