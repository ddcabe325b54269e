/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ActivityStateMachine.h"

#include <QDebug>

namespace PixelAgents
{

ActivityStateMachine::ActivityStateMachine(QObject *parent)
    : QObject(parent)
    , m_turnEndTimer(new QTimer(this))
{
    m_turnEndTimer->setSingleShot(true);
    m_turnEndTimer->setInterval(2000);
    connect(m_turnEndTimer, &QTimer::timeout, this, [this]() {
        setState(State::Waiting);
    });
}

ActivityStateMachine::~ActivityStateMachine()
{
    m_turnEndTimer->stop();
    cancelPendingCompletions();
}

void ActivityStateMachine::setTurnEndDebounceMs(int ms)
{
    m_turnEndTimer->setInterval(ms);
}

void ActivityStateMachine::setCompletionDelayMs(int ms)
{
    m_completionDelayMs = ms;
}

void ActivityStateMachine::processEvents(const QList<ActivityEvent> &events)
{
    for (const ActivityEvent &event : events) {
        processEvent(event);
    }
}

void ActivityStateMachine::processEvent(const ActivityEvent &event)
{
    switch (event.kind) {
    case ActivityEvent::Kind::OperationStarted:
        handleOperationStarted(event);
        break;
    case ActivityEvent::Kind::OperationCompleted:
        handleOperationCompleted(event);
        break;
    case ActivityEvent::Kind::TurnEnded:
        handleTurnEnded(event);
        break;
    case ActivityEvent::Kind::NewPrompt:
        handleNewPrompt();
        break;
    case ActivityEvent::Kind::Ignored:
        break;
    }
}

void ActivityStateMachine::reset()
{
    cancelTurnEnd();
    clearOperations();
    setState(State::Active);
}

void ActivityStateMachine::handleOperationStarted(const ActivityEvent &event)
{
    cancelTurnEnd();
    m_activeOperations.insert(event.operationId, event.label);
    setState(State::Active);
    Q_EMIT operationStarted(event.operationId, event.label);
}

void ActivityStateMachine::handleOperationCompleted(const ActivityEvent &event)
{
    // Completions without a matching start are dropped
    if (m_activeOperations.remove(event.operationId) == 0) {
        return;
    }

    const QString operationId = event.operationId;
    delete m_pendingCompletions.take(operationId);

    auto *timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, timer, operationId]() {
        m_pendingCompletions.remove(operationId);
        timer->deleteLater();
        Q_EMIT operationCompleted(operationId);
    });
    m_pendingCompletions.insert(operationId, timer);
    timer->start(m_completionDelayMs);
}

void ActivityStateMachine::handleTurnEnded(const ActivityEvent &event)
{
    if (!event.debounced) {
        cancelTurnEnd();
        setState(State::Waiting);
        return;
    }

    if (m_activeOperations.isEmpty()) {
        m_turnEndTimer->start();
    }
}

void ActivityStateMachine::handleNewPrompt()
{
    cancelTurnEnd();
    clearOperations();

    // Always re-announce: subscribers treat the clear as "back to work"
    m_state = State::Active;
    Q_EMIT activityChanged(m_state);
}

void ActivityStateMachine::setState(State newState)
{
    if (m_state == newState) {
        return;
    }
    m_state = newState;
    Q_EMIT activityChanged(newState);
}

void ActivityStateMachine::cancelTurnEnd()
{
    m_turnEndTimer->stop();
}

void ActivityStateMachine::cancelPendingCompletions()
{
    qDeleteAll(m_pendingCompletions);
    m_pendingCompletions.clear();
}

void ActivityStateMachine::clearOperations()
{
    cancelPendingCompletions();
    m_activeOperations.clear();
    Q_EMIT operationsCleared();
}

} // namespace PixelAgents

#include "moc_ActivityStateMachine.cpp"
