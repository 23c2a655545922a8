/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TABHOST_H
#define TABHOST_H

#include <QList>
#include <QString>

#include "tabs/Tab.h"

namespace Termgrid
{

/**
 * Tab operations other components may invoke on a grid cell without
 * knowing how the cell manages its terminals.
 */
class TabHost
{
public:
    virtual ~TabHost() = default;

    /** Append a new tab, make it active and return its id. */
    virtual QString addTab() = 0;

    /** Close the tab and kill its session; false if there is no such tab. */
    virtual bool closeTab(const QString &tabId) = 0;

    virtual QList<Tab> tabs() const = 0;
};

} // namespace Termgrid

#endif // TABHOST_H
