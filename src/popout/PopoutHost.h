/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef POPOUTHOST_H
#define POPOUTHOST_H

#include <QObject>

#include "tabs/Tab.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

/**
 * Window-hosting collaborator for popped-out tabs.
 *
 * hostTab() must mount a terminal binding attached to tab.sessionId (or
 * a fresh session when the tab has none) in a new top-level surface.
 * When that surface goes away the host emits popoutClosed() with the
 * tab as it was last bound.
 */
class TERMGRIDPRIVATE_EXPORT PopoutHost : public QObject
{
    Q_OBJECT
public:
    explicit PopoutHost(QObject *parent = nullptr);
    ~PopoutHost() override;

    virtual void hostTab(const Tab &tab) = 0;

Q_SIGNALS:
    void popoutClosed(const Termgrid::Tab &tab);
};

} // namespace Termgrid

#endif // POPOUTHOST_H
