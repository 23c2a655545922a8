/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef POPOUTWINDOWHOST_H
#define POPOUTWINDOWHOST_H

#include <QHash>
#include <QPointer>

#include "config/WorkspaceConfig.h"
#include "popout/PopoutHost.h"
#include "terminal/TerminalBinding.h"
#include "termgridprivate_export.h"

class QWidget;

namespace Termgrid
{

class SessionRegistry;

/**
 * Hosts each popped-out tab in its own top-level window, attached to
 * the session the tab already had.
 */
class TERMGRIDPRIVATE_EXPORT PopoutWindowHost : public PopoutHost
{
    Q_OBJECT
public:
    PopoutWindowHost(SessionRegistry *registry,
                     TerminalBinding::EmulationFactory emulationFactory,
                     const WorkspaceConfig &config,
                     QObject *parent = nullptr);
    ~PopoutWindowHost() override;

    void hostTab(const Tab &tab) override;

    int windowCount() const;
    QWidget *window(const QString &tabId) const;
    TerminalBinding *binding(const QString &tabId) const;

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    struct Popout {
        Tab tab;
        QPointer<QWidget> window;
        QPointer<TerminalBinding> binding;
    };

    void closePopout(const QString &tabId);

    SessionRegistry *_registry;
    TerminalBinding::EmulationFactory _emulationFactory;
    WorkspaceConfig _config;
    QHash<QString, Popout> _popouts;
};

} // namespace Termgrid

#endif // POPOUTWINDOWHOST_H
