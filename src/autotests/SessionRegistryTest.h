/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRYTEST_H
#define SESSIONREGISTRYTEST_H

#include <QObject>

namespace Termgrid
{
class SessionRegistryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testCreateRegistersSession();
    void testCreateFailure();
    void testWriteAndResizeForwarded();
    void testUnknownSessionIgnored();
    void testKillRemovesSession();
    void testPendingKillClearedByExit();
    void testKillFailureClearsPendingKill();
    void testDuplicateExitDropped();
    void testExitOfUnknownSessionDropped();
    void testOutputForwarded();
    void testWriteFailureReported();
    void testDestructorKillsAll();
};
}

#endif // SESSIONREGISTRYTEST_H
