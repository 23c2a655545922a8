/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef POPOUTCOORDINATORTEST_H
#define POPOUTCOORDINATORTEST_H

#include <QObject>

namespace Termgrid
{
class PopoutCoordinatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testPopoutMovesTabAndKeepsSession();
    void testPopoutWithoutHost();
    void testPopoutUnknownTab();
    void testClosingPopoutKillsSession();
    void testClosingUnknownPopoutIgnored();
    void testPopoutAfterExitHasNoSession();
};
}

#endif // POPOUTCOORDINATORTEST_H
