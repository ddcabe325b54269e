/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLAUNCHERTEST_H
#define SESSIONLAUNCHERTEST_H

#include <QObject>

namespace PixelAgents
{

class SessionLauncherTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Identifiers
    void testGenerateShortId();
    void testGenerateBindingId();
    void testBuildSessionName();

    // Command building
    void testBuildLaunchCommand();
    void testBuildLaunchCommandWithoutWorkingDir();
    void testBuildLaunchCommandQuotesWorkingDir();

    // Shell plumbing
    void testShellArgumentsLocal();
    void testShellArgumentsRemote();
    void testQuote();
    void testRunAsyncSuccess();
    void testRunAsyncFailure();
    void testRunAsyncTimeout();
    void testDestroyWithRunningCommand();
    void testConcurrentRunsKeepTheirOwnErrors();

    // Launching
    void testLaunchUnreachableNodeFails();
};

}

#endif // SESSIONLAUNCHERTEST_H
