/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentSupervisor.h"

#include <QDebug>
#include <QFileInfo>

namespace PixelAgents
{

AgentSupervisor::AgentSupervisor(const SupervisorConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_arbitrationTimer(new QTimer(this))
    , m_reapTimer(new QTimer(this))
{
    m_arbitrationTimer->setInterval(m_config.arbitrationIntervalMs);
    connect(m_arbitrationTimer, &QTimer::timeout, this, &AgentSupervisor::runArbitration);

    m_reapTimer->setInterval(m_config.reapIntervalMs);
    connect(m_reapTimer, &QTimer::timeout, this, &AgentSupervisor::reapStaleAgents);
}

AgentSupervisor::~AgentSupervisor()
{
    // Quiet teardown: no removal notifications from a dying supervisor
    for (TrackedAgent *agent : std::as_const(m_agents)) {
        agent->disconnect(this);
        agent->activity()->disconnect(this);
        agent->stopTailing();
    }
}

void AgentSupervisor::setNodes(const QList<ClusterNode> &nodes)
{
    for (const ClusterNode &node : nodes) {
        if (scannerFor(node.name)) {
            qWarning() << "AgentSupervisor: Duplicate node" << node.name << "ignored";
            continue;
        }
        if (node.isLocal) {
            addScanner(new LocalSessionScanner(node, m_config));
        } else {
            addScanner(new RemoteSessionScanner(node, m_config));
        }
    }
}

void AgentSupervisor::addScanner(SessionScanner *scanner)
{
    scanner->setParent(this);
    scanner->setKnownPredicate([this](const SessionFile &file) {
        return m_ledger.isKnown(file);
    });
    connect(scanner, &SessionScanner::sessionDiscovered, this, [this, scanner](const SessionFile &file, bool initialScan) {
        onSessionDiscovered(scanner, file, initialScan);
    });
    m_scanners.append(scanner);

    if (m_running) {
        scanner->start();
    }
}

void AgentSupervisor::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    qDebug() << "AgentSupervisor: Starting with" << m_scanners.size() << "node(s)";
    for (SessionScanner *scanner : std::as_const(m_scanners)) {
        scanner->start();
    }
    m_arbitrationTimer->start();
    m_reapTimer->start();
}

void AgentSupervisor::stop()
{
    m_running = false;

    for (SessionScanner *scanner : std::as_const(m_scanners)) {
        scanner->stop();
    }
    m_arbitrationTimer->stop();
    m_reapTimer->stop();

    const QList<int> ids = m_agents.keys();
    for (int id : ids) {
        removeAgent(id, QStringLiteral("shutdown"));
    }
}

int AgentSupervisor::registerLaunchedSession(const ClusterNode &node, const QString &workingDirectory, const QString &bindingId)
{
    if (bindingId.isEmpty()) {
        qWarning() << "AgentSupervisor: Launched session without a binding id";
        return -1;
    }

    const QString dirName = SessionFile::encodeProjectDirName(workingDirectory);
    const QString root = node.isLocal ? m_config.effectiveProjectsRoot() : QStringLiteral("~/.claude/projects");
    const QString projectDir = root + QLatin1Char('/') + dirName;

    TrackedAgent *agent = createAgent(node, projectDir, SessionFile::projectKeyFromDirName(dirName));
    agent->setSessionBindingId(bindingId);

    // Sessions already on disk belong to someone else
    QList<SessionFile> existing;
    const QList<SessionListingEntry> entries = listProjectDirectory(node, projectDir);
    for (const SessionListingEntry &entry : entries) {
        existing.append(entry.file);
    }
    m_ledger.setKnownAtStartup(agent->id(), existing);

    qDebug() << "AgentSupervisor: Agent" << agent->id() << "waiting for session" << bindingId << "on" << node.name;
    Q_EMIT agentCreated(agent->id(), node.name, agent->projectKey());
    return agent->id();
}

bool AgentSupervisor::closeAgent(int agentId)
{
    if (!m_agents.contains(agentId)) {
        return false;
    }
    removeAgent(agentId, QStringLiteral("closed"));
    return true;
}

QList<AgentSnapshot> AgentSupervisor::snapshot() const
{
    QList<AgentSnapshot> result;
    result.reserve(m_agents.size());
    for (const TrackedAgent *agent : m_agents) {
        result.append(agent->snapshot());
    }
    return result;
}

void AgentSupervisor::onSessionDiscovered(SessionScanner *scanner, const SessionFile &file, bool initialScan)
{
    if (m_ledger.isKnown(file)) {
        return;
    }

    // A launched or rotating agent in the same directory gets first pick
    applyDecisions(m_ledger.arbitrate(candidates(file.node.name, file.projectDir),
                                      [this](const ClusterNode &node, const QString &projectDir) {
                                          return listProjectDirectory(node, projectDir);
                                      },
                                      QDateTime::currentDateTimeUtc(),
                                      m_config.rotationStalenessMs));
    if (m_ledger.isClaimed(file)) {
        return;
    }

    TrackedAgent *agent = createAgent(scanner->node(), file.projectDir, file.projectKey);

    QList<SessionFile> existing;
    const QList<SessionListingEntry> entries = listProjectDirectory(file.node, file.projectDir);
    for (const SessionListingEntry &entry : entries) {
        if (!(entry.file == file)) {
            existing.append(entry.file);
        }
    }
    m_ledger.setKnownAtStartup(agent->id(), existing);

    if (!m_ledger.claim(agent->id(), file)) {
        // Never announced, so no removal notification either
        qWarning() << "AgentSupervisor: Could not claim" << file.identity();
        m_agents.remove(agent->id());
        m_ledger.forgetAgent(agent->id());
        agent->deleteLater();
        return;
    }

    qDebug() << "AgentSupervisor: Agent" << agent->id() << "adopted" << file.identity();
    Q_EMIT agentCreated(agent->id(), agent->node().name, agent->projectKey());

    // Startup sessions are followed from their current end
    agent->bindFile(file, !initialScan);
}

TrackedAgent *AgentSupervisor::createAgent(const ClusterNode &node, const QString &projectDir, const QString &projectKey)
{
    const int id = m_nextAgentId++;
    auto *agent = new TrackedAgent(id, node, projectDir, projectKey, m_config, this);
    m_agents.insert(id, agent);

    ActivityStateMachine *activity = agent->activity();
    connect(activity, &ActivityStateMachine::operationStarted, this, [this, id](const QString &operationId, const QString &label) {
        Q_EMIT operationStarted(id, operationId, label);
    });
    connect(activity, &ActivityStateMachine::operationCompleted, this, [this, id](const QString &operationId) {
        Q_EMIT operationCompleted(id, operationId);
    });
    connect(activity, &ActivityStateMachine::operationsCleared, this, [this, id]() {
        Q_EMIT operationsCleared(id);
    });
    connect(activity, &ActivityStateMachine::activityChanged, this, [this, id](ActivityStateMachine::State state) {
        Q_EMIT activityChanged(id, state);
    });
    connect(agent, &TrackedAgent::streamClosed, this, [this](int agentId) {
        removeAgent(agentId, QStringLiteral("remote stream closed"));
    });

    return agent;
}

void AgentSupervisor::runArbitration()
{
    if (m_agents.isEmpty()) {
        return;
    }

    applyDecisions(m_ledger.arbitrate(candidates(),
                                      [this](const ClusterNode &node, const QString &projectDir) {
                                          return listProjectDirectory(node, projectDir);
                                      },
                                      QDateTime::currentDateTimeUtc(),
                                      m_config.rotationStalenessMs));
}

void AgentSupervisor::applyDecisions(const QList<ClaimDecision> &decisions)
{
    for (const ClaimDecision &decision : decisions) {
        TrackedAgent *agent = m_agents.value(decision.agentId, nullptr);
        if (!agent) {
            continue;
        }

        if (decision.rotation) {
            if (!m_ledger.switchFile(agent->id(), agent->currentFile(), decision.file)) {
                continue;
            }
            agent->rotateTo(decision.file);
        } else {
            if (!m_ledger.claim(agent->id(), decision.file)) {
                continue;
            }
            qDebug() << "AgentSupervisor: Agent" << agent->id() << "bound to" << decision.file.identity();
            agent->bindFile(decision.file, true);
        }

        if (SessionScanner *scanner = scannerFor(decision.file.node.name)) {
            scanner->markKnown(decision.file.path);
        }
    }
}

void AgentSupervisor::reapStaleAgents()
{
    reapStaleAgentsAt(QDateTime::currentDateTimeUtc());
}

void AgentSupervisor::reapStaleAgentsAt(const QDateTime &now)
{
    const QList<int> ids = m_agents.keys();
    for (int id : ids) {
        TrackedAgent *agent = m_agents.value(id, nullptr);
        if (!agent) {
            continue;
        }

        // Launched sessions that never wrote a file, on any node
        if (!agent->isBound()) {
            if (agent->createdAt().msecsTo(now) > m_config.staleTimeoutMs) {
                removeAgent(id, QStringLiteral("session never appeared"));
            }
            continue;
        }

        // Remote agents live as long as their stream
        if (!agent->node().isLocal) {
            continue;
        }

        const QFileInfo info(agent->currentFile().path);
        if (!info.exists()) {
            removeAgent(id, QStringLiteral("file disappeared"));
        } else if (info.lastModified().msecsTo(now) > m_config.staleTimeoutMs) {
            removeAgent(id, QStringLiteral("stale"));
        }
    }
}

void AgentSupervisor::removeAgent(int agentId, const QString &reason)
{
    TrackedAgent *agent = m_agents.take(agentId);
    if (!agent) {
        return;
    }

    // Nothing from this agent may reach subscribers after agentRemoved()
    agent->stopTailing();
    agent->disconnect(this);
    agent->activity()->disconnect(this);
    m_ledger.forgetAgent(agentId);

    qDebug() << "AgentSupervisor: Removing agent" << agentId << "(" << reason << ")";
    Q_EMIT agentRemoved(agentId);
    agent->deleteLater();
}

QList<ClaimCandidate> AgentSupervisor::candidates(const QString &nodeName, const QString &projectDir) const
{
    QList<ClaimCandidate> result;
    for (const TrackedAgent *agent : m_agents) {
        if (!nodeName.isEmpty() && agent->node().name != nodeName) {
            continue;
        }
        if (!projectDir.isEmpty() && !sameProjectDir(agent->projectDir(), projectDir)) {
            continue;
        }

        ClaimCandidate candidate;
        candidate.agentId = agent->id();
        candidate.node = agent->node();
        candidate.projectDir = agent->projectDir();
        candidate.currentPath = agent->currentFile().path;
        candidate.sessionBindingId = agent->sessionBindingId();
        candidate.lastActivity = agent->lastActivity();
        result.append(candidate);
    }
    return result;
}

QList<SessionListingEntry> AgentSupervisor::listProjectDirectory(const ClusterNode &node, const QString &projectDir) const
{
    if (SessionScanner *scanner = scannerFor(node.name)) {
        return scanner->projectDirectoryEntries(projectDir);
    }
    if (node.isLocal) {
        return LocalSessionScanner::listDirectory(node, projectDir);
    }
    return {};
}

SessionScanner *AgentSupervisor::scannerFor(const QString &nodeName) const
{
    for (SessionScanner *scanner : m_scanners) {
        if (scanner->node().name == nodeName) {
            return scanner;
        }
    }
    return nullptr;
}

bool AgentSupervisor::sameProjectDir(const QString &a, const QString &b)
{
    if (a == b) {
        return true;
    }
    // "~/.claude/projects/x" and "/home/u/.claude/projects/x" are the same place
    return a.section(QLatin1Char('/'), -1, -1, QString::SectionSkipEmpty) == b.section(QLatin1Char('/'), -1, -1, QString::SectionSkipEmpty);
}

} // namespace PixelAgents

#include "moc_AgentSupervisor.cpp"
