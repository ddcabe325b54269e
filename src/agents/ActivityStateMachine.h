/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIVITYSTATEMACHINE_H
#define ACTIVITYSTATEMACHINE_H

#include "pixelagents_export.h"

#include "TranscriptParser.h"

#include <QHash>
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QTimer>

namespace PixelAgents
{

/**
 * ActivityStateMachine reduces one agent's ActivityEvents into its current
 * activity and the notifications subscribers see.
 *
 * Two pending timers exist per agent:
 * - the turn-end debounce armed by text-only assistant records, cancelled by
 *   any later operation start, new prompt or authoritative turn end
 * - one completion delay per finished operation, so a start and completion
 *   read in the same batch still show up as a short "active" blip
 */
class PIXELAGENTS_EXPORT ActivityStateMachine : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Active, // operations in flight, or a turn in progress
        Waiting, // turn ended, waiting for user input
    };
    Q_ENUM(State)

    explicit ActivityStateMachine(QObject *parent = nullptr);
    ~ActivityStateMachine() override;

    void setTurnEndDebounceMs(int ms);
    void setCompletionDelayMs(int ms);

    State state() const
    {
        return m_state;
    }

    bool isWaiting() const
    {
        return m_state == State::Waiting;
    }

    /**
     * Operations believed in flight: operation id -> label
     */
    QMap<QString, QString> activeOperations() const
    {
        return m_activeOperations;
    }

    bool isTurnEndPending() const
    {
        return m_turnEndTimer->isActive();
    }

    int pendingCompletionCount() const
    {
        return m_pendingCompletions.size();
    }

public Q_SLOTS:
    void processEvent(const PixelAgents::ActivityEvent &event);
    void processEvents(const QList<PixelAgents::ActivityEvent> &events);

    /**
     * Forget everything (file rotation). Emits operationsCleared().
     */
    void reset();

Q_SIGNALS:
    void operationStarted(const QString &operationId, const QString &label);
    void operationCompleted(const QString &operationId);
    void operationsCleared();
    void activityChanged(PixelAgents::ActivityStateMachine::State state);

private:
    void handleOperationStarted(const ActivityEvent &event);
    void handleOperationCompleted(const ActivityEvent &event);
    void handleTurnEnded(const ActivityEvent &event);
    void handleNewPrompt();

    void setState(State newState);
    void cancelTurnEnd();
    void cancelPendingCompletions();
    void clearOperations();

    State m_state = State::Active;
    QMap<QString, QString> m_activeOperations;

    QTimer *m_turnEndTimer = nullptr;
    QHash<QString, QTimer *> m_pendingCompletions;
    int m_completionDelayMs = 300;
};

} // namespace PixelAgents

#endif // ACTIVITYSTATEMACHINE_H
