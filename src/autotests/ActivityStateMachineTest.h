/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIVITYSTATEMACHINETEST_H
#define ACTIVITYSTATEMACHINETEST_H

#include <QObject>

namespace PixelAgents
{

class ActivityStateMachineTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testInitialState();

    // Operations
    void testOperationStartedNotifiesImmediately();
    void testOperationCompletedIsDelayed();
    void testStartAndCompleteInSameBatch();
    void testUnmatchedCompletionIgnored();
    void testOperationStartWakesWaitingAgent();

    // Turn end
    void testDebouncedTurnEndFires();
    void testDebouncedTurnEndCancelledByOperation();
    void testDebouncedTurnEndNotArmedWithActiveOperations();
    void testAuthoritativeTurnEndIsImmediate();
    void testAuthoritativeTurnEndOverridesDebounce();

    // New prompt
    void testNewPromptClearsOperations();
    void testNewPromptSuppressesPendingCompletions();
    void testNewPromptCancelsDebounce();

    // Reset
    void testReset();
};

}

#endif // ACTIVITYSTATEMACHINETEST_H
