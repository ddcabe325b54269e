/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TrackedAgent.h"

#include "TranscriptParser.h"

#include <QDebug>
#include <QFileInfo>
#include <QJsonArray>

namespace PixelAgents
{

QJsonObject AgentSnapshot::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("node")] = nodeName;
    obj[QStringLiteral("projectKey")] = projectKey;
    obj[QStringLiteral("path")] = currentPath;
    obj[QStringLiteral("waiting")] = waiting;

    QJsonArray operations;
    for (auto it = activeOperations.constBegin(); it != activeOperations.constEnd(); ++it) {
        QJsonObject operation;
        operation[QStringLiteral("operationId")] = it.key();
        operation[QStringLiteral("label")] = it.value();
        operations.append(operation);
    }
    obj[QStringLiteral("operations")] = operations;
    return obj;
}

TrackedAgent::TrackedAgent(int id,
                           const ClusterNode &node,
                           const QString &projectDir,
                           const QString &projectKey,
                           const SupervisorConfig &config,
                           QObject *parent)
    : QObject(parent)
    , m_id(id)
    , m_node(node)
    , m_projectDir(projectDir)
    , m_projectKey(projectKey)
    , m_config(config)
    , m_createdAt(QDateTime::currentDateTimeUtc())
    , m_activity(new ActivityStateMachine(this))
{
    m_activity->setTurnEndDebounceMs(m_config.turnEndDebounceMs);
    m_activity->setCompletionDelayMs(m_config.completionDelayMs);
}

TrackedAgent::~TrackedAgent()
{
    stopTailing();
}

QDateTime TrackedAgent::lastActivity() const
{
    return m_tailer ? m_tailer->lastActivity() : m_createdAt;
}

void TrackedAgent::bindFile(const SessionFile &file, bool fromStart)
{
    stopTailing();

    m_currentFile = file;
    m_projectDir = file.projectDir;
    if (m_projectKey.isEmpty()) {
        m_projectKey = file.projectKey;
    }

    if (m_node.isLocal) {
        const qint64 startOffset = fromStart ? 0 : QFileInfo(file.path).size();
        m_tailer = new LocalFileTailer(file, startOffset, m_config.pollIntervalMs, this);
    } else {
        RemoteShell::Options options;
        options.connectTimeoutSecs = m_config.streamConnectTimeoutSecs;
        options.serverAliveIntervalSecs = m_config.serverAliveIntervalSecs;
        m_tailer = new RemoteFileTailer(file, options, fromStart ? -1 : m_config.remoteBacklogLines, this);
        connect(m_tailer, &FileTailer::closed, this, [this]() {
            Q_EMIT streamClosed(m_id);
        });
    }

    connect(m_tailer, &FileTailer::linesReceived, this, &TrackedAgent::onLinesReceived);
    m_tailer->start();

    qDebug() << "TrackedAgent: Agent" << m_id << "following" << file.identity() << (fromStart ? "from start" : "from end");
}

void TrackedAgent::rotateTo(const SessionFile &file)
{
    qDebug() << "TrackedAgent: Agent" << m_id << "switching from" << m_currentFile.path << "to" << file.path;

    stopTailing();
    m_activity->reset();
    bindFile(file, true);
}

void TrackedAgent::stopTailing()
{
    if (!m_tailer) {
        return;
    }

    FileTailer *tailer = m_tailer;
    m_tailer = nullptr;
    tailer->disconnect(this);
    tailer->stop();
    tailer->deleteLater();
}

void TrackedAgent::onLinesReceived(const QList<QByteArray> &lines)
{
    for (const QByteArray &line : lines) {
        m_activity->processEvents(TranscriptParser::parseLine(line));
    }
}

AgentSnapshot TrackedAgent::snapshot() const
{
    AgentSnapshot snap;
    snap.id = m_id;
    snap.nodeName = m_node.name;
    snap.projectKey = m_projectKey;
    snap.currentPath = m_currentFile.path;
    snap.activeOperations = m_activity->activeOperations();
    snap.waiting = m_activity->isWaiting();
    return snap;
}

} // namespace PixelAgents

#include "moc_TrackedAgent.cpp"
