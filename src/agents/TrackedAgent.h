/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRACKEDAGENT_H
#define TRACKEDAGENT_H

#include "pixelagents_export.h"

#include "ActivityStateMachine.h"
#include "FileTailer.h"
#include "SessionFile.h"
#include "SupervisorConfig.h"

#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QString>

namespace PixelAgents
{

/**
 * Point-in-time view of an agent, for subscribers that attach late
 */
struct PIXELAGENTS_EXPORT AgentSnapshot {
    int id = -1;
    QString nodeName;
    QString projectKey;
    QString currentPath; // empty while waiting for a launched session's file
    QMap<QString, QString> activeOperations; // operation id -> label
    bool waiting = false;

    QJsonObject toJson() const;
};

/**
 * TrackedAgent is one session being followed: the file it currently owns,
 * the tailer reading that file and the state machine fed by the tailer.
 *
 * Ownership decisions are made by AgentSupervisor; the agent just does
 * what it is told (bind, rotate, stop).
 */
class PIXELAGENTS_EXPORT TrackedAgent : public QObject
{
    Q_OBJECT

public:
    TrackedAgent(int id,
                 const ClusterNode &node,
                 const QString &projectDir,
                 const QString &projectKey,
                 const SupervisorConfig &config,
                 QObject *parent = nullptr);
    ~TrackedAgent() override;

    int id() const
    {
        return m_id;
    }

    const ClusterNode &node() const
    {
        return m_node;
    }

    QString projectDir() const
    {
        return m_projectDir;
    }

    QString projectKey() const
    {
        return m_projectKey;
    }

    /**
     * Invalid while the agent has no file yet
     */
    SessionFile currentFile() const
    {
        return m_currentFile;
    }

    bool isBound() const
    {
        return m_currentFile.isValid();
    }

    QString sessionBindingId() const
    {
        return m_sessionBindingId;
    }

    void setSessionBindingId(const QString &id)
    {
        m_sessionBindingId = id;
    }

    QDateTime createdAt() const
    {
        return m_createdAt;
    }

    /**
     * Last time bytes were read from the current file, or the creation
     * time when nothing has been read yet
     */
    QDateTime lastActivity() const;

    ActivityStateMachine *activity() const
    {
        return m_activity;
    }

    FileTailer *tailer() const
    {
        return m_tailer;
    }

    /**
     * Start following @p file. With @p fromStart the whole file is
     * replayed, otherwise only data written from now on is read.
     */
    void bindFile(const SessionFile &file, bool fromStart);

    /**
     * Drop the current file and all activity derived from it, then follow
     * @p file from its beginning
     */
    void rotateTo(const SessionFile &file);

    /**
     * Stop and delete the tailer. Returns once no more lines can arrive.
     */
    void stopTailing();

    AgentSnapshot snapshot() const;

Q_SIGNALS:
    /**
     * The remote stream for the current file ended
     */
    void streamClosed(int agentId);

private:
    void onLinesReceived(const QList<QByteArray> &lines);

    int m_id;
    ClusterNode m_node;
    QString m_projectDir;
    QString m_projectKey;
    QString m_sessionBindingId;
    SupervisorConfig m_config;
    QDateTime m_createdAt;

    SessionFile m_currentFile;
    FileTailer *m_tailer = nullptr;
    ActivityStateMachine *m_activity = nullptr;
};

} // namespace PixelAgents

#endif // TRACKEDAGENT_H
