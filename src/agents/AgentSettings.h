/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTSETTINGS_H
#define AGENTSETTINGS_H

#include "pixelagents_export.h"

#include "SupervisorConfig.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace PixelAgents
{

/**
 * AgentSettings manages the tracker's tunables.
 *
 * Settings live in ~/.config/pixelagentsrc:
 * - [Scanner] where and how often to look for sessions
 * - [Tailer] local poll interval, remote backlog
 * - [Activity] turn-end debounce and completion delay
 * - [Ownership] rotation staleness and arbitration interval
 * - [Reaper] stale timeout and sweep interval
 * - [Cluster] the node list file
 */
class PIXELAGENTS_EXPORT AgentSettings : public QObject
{
    Q_OBJECT

public:
    /**
     * @param configName config file name, or a full path (tests)
     */
    explicit AgentSettings(const QString &configName = QStringLiteral("pixelagentsrc"), QObject *parent = nullptr);
    ~AgentSettings() override;

    QString projectsRoot() const;
    void setProjectsRoot(const QString &path);

    int scanIntervalMs() const;
    void setScanIntervalMs(int ms);

    /**
     * How recent a session file must be to be adopted at startup
     */
    int activityWindowMinutes() const;
    void setActivityWindowMinutes(int minutes);

    int connectTimeoutSecs() const;
    void setConnectTimeoutSecs(int secs);

    int listTimeoutMs() const;
    void setListTimeoutMs(int ms);

    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    int remoteBacklogLines() const;
    void setRemoteBacklogLines(int lines);

    int turnEndDebounceMs() const;
    void setTurnEndDebounceMs(int ms);

    int completionDelayMs() const;
    void setCompletionDelayMs(int ms);

    int rotationStalenessMs() const;
    void setRotationStalenessMs(int ms);

    int arbitrationIntervalMs() const;
    void setArbitrationIntervalMs(int ms);

    int staleTimeoutMinutes() const;
    void setStaleTimeoutMinutes(int minutes);

    int reapIntervalMs() const;
    void setReapIntervalMs(int ms);

    /**
     * Cluster node list (JSON), ~/.pixel-agents/cluster.json by default
     */
    QString nodesFile() const;
    void setNodesFile(const QString &path);

    /**
     * Everything above as the struct the supervisor consumes
     */
    SupervisorConfig supervisorConfig() const;

    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    int readInt(const QString &group, const char *key, int defaultValue) const;
    void writeInt(const QString &group, const char *key, int value);

    KSharedConfigPtr m_config;
};

} // namespace PixelAgents

#endif // AGENTSETTINGS_H
