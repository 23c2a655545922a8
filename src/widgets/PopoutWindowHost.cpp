/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/PopoutWindowHost.h"

#include "session/SessionRegistry.h"
#include "terminal/TerminalEmulation.h"
#include "widgets/TerminalPageWidget.h"

#include <QEvent>
#include <QLabel>
#include <QLoggingCategory>
#include <QVBoxLayout>
#include <QWidget>

#include <utility>

Q_DECLARE_LOGGING_CATEGORY(TermgridPopout)

namespace Termgrid
{

PopoutWindowHost::PopoutWindowHost(SessionRegistry *registry,
                                   TerminalBinding::EmulationFactory emulationFactory,
                                   const WorkspaceConfig &config,
                                   QObject *parent)
    : PopoutHost(parent)
    , _registry(registry)
    , _emulationFactory(std::move(emulationFactory))
    , _config(config)
{
}

PopoutWindowHost::~PopoutWindowHost()
{
    // Windows still open at teardown are closed without announcing
    // anything; the registry kills their sessions on shutdown.
    for (auto it = _popouts.begin(); it != _popouts.end(); ++it) {
        if (it->window) {
            it->window->removeEventFilter(this);
            delete it->window.data();
        }
        if (it->binding) {
            it->binding->release();
            delete it->binding.data();
        }
    }
}

void PopoutWindowHost::hostTab(const Tab &tab)
{
    TerminalBinding::Options options;
    options.autoCreate = _config.autoCreateSessions;
    options.workingDirectory = tab.workingDirectory.isEmpty() ? _config.defaultWorkingDirectory : tab.workingDirectory;
    options.sessionId = tab.sessionId;

    auto *binding = new TerminalBinding(_registry, _emulationFactory, options, this);
    binding->mount(_config.initialLines, _config.initialColumns);

    QWidget *view = binding->emulation() ? binding->emulation()->view() : nullptr;
    if (!view) {
        view = new QLabel(QStringLiteral("No terminal view"));
    }

    auto *window = new QWidget;
    window->setAttribute(Qt::WA_DeleteOnClose);
    window->setWindowTitle(tab.title);
    window->setProperty("termgridTabId", tab.id);
    window->installEventFilter(this);

    auto *page = new TerminalPageWidget(view, window);
    auto *layout = new QVBoxLayout(window);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(page);

    const QString tabId = tab.id;
    connect(page, &TerminalPageWidget::geometryChanged, binding, &TerminalBinding::geometryChanged);
    connect(binding, &TerminalBinding::bound, this, [this, tabId](const QString &sessionId) {
        auto it = _popouts.find(tabId);
        if (it != _popouts.end()) {
            it->tab.sessionId = sessionId;
        }
    });
    connect(binding, &TerminalBinding::sessionExited, this, [this, tabId]() {
        auto it = _popouts.find(tabId);
        if (it != _popouts.end()) {
            it->tab.sessionId.clear();
        }
    });

    Popout popout;
    popout.tab = tab;
    popout.window = window;
    popout.binding = binding;
    _popouts.insert(tab.id, popout);

    qCDebug(TermgridPopout) << "Hosting" << tab.title << "in a new window";
    window->resize(800, 480);
    window->show();
    binding->requestFocus();
}

int PopoutWindowHost::windowCount() const
{
    return _popouts.size();
}

QWidget *PopoutWindowHost::window(const QString &tabId) const
{
    return _popouts.value(tabId).window;
}

TerminalBinding *PopoutWindowHost::binding(const QString &tabId) const
{
    return _popouts.value(tabId).binding;
}

bool PopoutWindowHost::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::Close) {
        const QString tabId = watched->property("termgridTabId").toString();
        if (_popouts.contains(tabId)) {
            closePopout(tabId);
        }
    }
    return PopoutHost::eventFilter(watched, event);
}

void PopoutWindowHost::closePopout(const QString &tabId)
{
    const Popout popout = _popouts.take(tabId);
    if (popout.window) {
        popout.window->removeEventFilter(this);
    }
    if (popout.binding) {
        popout.binding->release();
        popout.binding->deleteLater();
    }
    Q_EMIT popoutClosed(popout.tab);
}

} // namespace Termgrid

#include "moc_PopoutWindowHost.cpp"
