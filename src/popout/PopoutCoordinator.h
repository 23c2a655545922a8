/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef POPOUTCOORDINATOR_H
#define POPOUTCOORDINATOR_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>

#include "tabs/Tab.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

class PopoutHost;
class SessionRegistry;
class TabController;

/**
 * Moves a tab out of its grid cell into a top-level window.
 *
 * The backend session is handed over as-is: the grid binding lets go of
 * it without killing it and the host attaches a new binding to the same
 * id.  Output produced after the handoff reaches the new window; screen
 * contents rendered before it are not carried over.
 */
class TERMGRIDPRIVATE_EXPORT PopoutCoordinator : public QObject
{
    Q_OBJECT
public:
    PopoutCoordinator(SessionRegistry *registry, PopoutHost *host, QObject *parent = nullptr);

    void setHost(PopoutHost *host);
    PopoutHost *host() const;

    bool popout(TabController *controller, const QString &tabId);

    bool isPoppedOut(const QString &tabId) const;
    QList<Tab> poppedOutTabs() const;

Q_SIGNALS:
    void tabPoppedOut(const QString &cellId, const Termgrid::Tab &tab);
    void popoutClosed(const Termgrid::Tab &tab);

private Q_SLOTS:
    void onPopoutClosed(const Termgrid::Tab &tab);

private:
    SessionRegistry *_registry;
    QPointer<PopoutHost> _host;
    QHash<QString, Tab> _popouts;
};

} // namespace Termgrid

#endif // POPOUTCOORDINATOR_H
