/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTSUPERVISOR_H
#define AGENTSUPERVISOR_H

#include "pixelagents_export.h"

#include "ActivityStateMachine.h"
#include "OwnershipLedger.h"
#include "SessionFile.h"
#include "SessionScanner.h"
#include "SupervisorConfig.h"
#include "TrackedAgent.h"

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QTimer>

namespace PixelAgents
{

/**
 * AgentSupervisor owns every tracked agent.
 *
 * It runs one SessionScanner per node, turns discovered session files
 * into agents (or hands them to an existing agent whose session rotated),
 * forwards each agent's activity to subscribers and tears agents down when
 * they are closed, go stale, or lose their remote stream.
 *
 * All ledger and agent table changes happen here, on the thread the
 * supervisor lives in.
 */
class PIXELAGENTS_EXPORT AgentSupervisor : public QObject
{
    Q_OBJECT

public:
    explicit AgentSupervisor(const SupervisorConfig &config, QObject *parent = nullptr);
    ~AgentSupervisor() override;

    const SupervisorConfig &config() const
    {
        return m_config;
    }

    /**
     * Create a scanner for each node: filesystem for local nodes, ssh for
     * remote ones
     */
    void setNodes(const QList<ClusterNode> &nodes);

    /**
     * Take ownership of @p scanner and feed its discoveries into the
     * supervisor
     */
    void addScanner(SessionScanner *scanner);

    QList<SessionScanner *> scanners() const
    {
        return m_scanners;
    }

    void start();

    /**
     * Stop scanning and remove every agent (agentRemoved() is emitted for
     * each)
     */
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * Track a session we launched ourselves, before its file exists.
     * The agent only ever binds to "<binding id>.jsonl" in the project
     * directory of @p workingDirectory; files already there are ignored.
     *
     * @return the new agent id, or -1 when @p bindingId is empty
     */
    int registerLaunchedSession(const ClusterNode &node, const QString &workingDirectory, const QString &bindingId);

    /**
     * Remove an agent as if it had gone stale. Returns false for unknown ids.
     */
    bool closeAgent(int agentId);

    QList<int> agentIds() const
    {
        return m_agents.keys();
    }

    bool hasAgent(int agentId) const
    {
        return m_agents.contains(agentId);
    }

    TrackedAgent *agent(int agentId) const
    {
        return m_agents.value(agentId, nullptr);
    }

    /**
     * Current agents in id order
     */
    QList<AgentSnapshot> snapshot() const;

    const OwnershipLedger &ledger() const
    {
        return m_ledger;
    }

public Q_SLOTS:
    /**
     * One ownership pass over every agent (pending bindings and rotations)
     */
    void runArbitration();

    void reapStaleAgents();
    void reapStaleAgentsAt(const QDateTime &now);

Q_SIGNALS:
    void agentCreated(int agentId, const QString &nodeName, const QString &projectKey);
    void agentRemoved(int agentId);
    void operationStarted(int agentId, const QString &operationId, const QString &label);
    void operationCompleted(int agentId, const QString &operationId);
    void operationsCleared(int agentId);
    void activityChanged(int agentId, PixelAgents::ActivityStateMachine::State state);

private:
    void onSessionDiscovered(SessionScanner *scanner, const SessionFile &file, bool initialScan);

    TrackedAgent *createAgent(const ClusterNode &node, const QString &projectDir, const QString &projectKey);
    void applyDecisions(const QList<ClaimDecision> &decisions);
    void removeAgent(int agentId, const QString &reason);

    QList<ClaimCandidate> candidates(const QString &nodeName = QString(), const QString &projectDir = QString()) const;
    QList<SessionListingEntry> listProjectDirectory(const ClusterNode &node, const QString &projectDir) const;
    SessionScanner *scannerFor(const QString &nodeName) const;

    static bool sameProjectDir(const QString &a, const QString &b);

    SupervisorConfig m_config;
    OwnershipLedger m_ledger;
    QList<SessionScanner *> m_scanners;
    QMap<int, TrackedAgent *> m_agents;
    int m_nextAgentId = 1;
    bool m_running = false;

    QTimer *m_arbitrationTimer = nullptr;
    QTimer *m_reapTimer = nullptr;
};

} // namespace PixelAgents

#endif // AGENTSUPERVISOR_H
