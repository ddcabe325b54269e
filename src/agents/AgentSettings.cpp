/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentSettings.h"

#include <KConfigGroup>
#include <QDir>

namespace PixelAgents
{

namespace
{
const QString ScannerGroup = QStringLiteral("Scanner");
const QString TailerGroup = QStringLiteral("Tailer");
const QString ActivityGroup = QStringLiteral("Activity");
const QString OwnershipGroup = QStringLiteral("Ownership");
const QString ReaperGroup = QStringLiteral("Reaper");
const QString ClusterGroup = QStringLiteral("Cluster");
}

AgentSettings::AgentSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    // Load config from ~/.config/pixelagentsrc
    m_config = KSharedConfig::openConfig(configName);
}

AgentSettings::~AgentSettings()
{
    save();
}

int AgentSettings::readInt(const QString &group, const char *key, int defaultValue) const
{
    KConfigGroup configGroup(m_config, group);
    const int value = configGroup.readEntry(key, defaultValue);
    // Zero or negative intervals would spin timers; fall back to the default
    return value > 0 ? value : defaultValue;
}

void AgentSettings::writeInt(const QString &group, const char *key, int value)
{
    KConfigGroup configGroup(m_config, group);
    configGroup.writeEntry(key, value);
    Q_EMIT settingsChanged();
}

QString AgentSettings::projectsRoot() const
{
    KConfigGroup group(m_config, ScannerGroup);
    return group.readEntry("ProjectsRoot", SupervisorConfig::defaultProjectsRoot());
}

void AgentSettings::setProjectsRoot(const QString &path)
{
    KConfigGroup group(m_config, ScannerGroup);
    group.writeEntry("ProjectsRoot", path);
    Q_EMIT settingsChanged();
}

int AgentSettings::scanIntervalMs() const
{
    return readInt(ScannerGroup, "ScanIntervalMs", 3000);
}

void AgentSettings::setScanIntervalMs(int ms)
{
    writeInt(ScannerGroup, "ScanIntervalMs", ms);
}

int AgentSettings::activityWindowMinutes() const
{
    return readInt(ScannerGroup, "ActivityWindowMinutes", 10);
}

void AgentSettings::setActivityWindowMinutes(int minutes)
{
    writeInt(ScannerGroup, "ActivityWindowMinutes", minutes);
}

int AgentSettings::connectTimeoutSecs() const
{
    return readInt(ScannerGroup, "ConnectTimeoutSecs", 3);
}

void AgentSettings::setConnectTimeoutSecs(int secs)
{
    writeInt(ScannerGroup, "ConnectTimeoutSecs", secs);
}

int AgentSettings::listTimeoutMs() const
{
    return readInt(ScannerGroup, "ListTimeoutMs", 10000);
}

void AgentSettings::setListTimeoutMs(int ms)
{
    writeInt(ScannerGroup, "ListTimeoutMs", ms);
}

int AgentSettings::pollIntervalMs() const
{
    return readInt(TailerGroup, "PollIntervalMs", 2000);
}

void AgentSettings::setPollIntervalMs(int ms)
{
    writeInt(TailerGroup, "PollIntervalMs", ms);
}

int AgentSettings::remoteBacklogLines() const
{
    return readInt(TailerGroup, "RemoteBacklogLines", 50);
}

void AgentSettings::setRemoteBacklogLines(int lines)
{
    writeInt(TailerGroup, "RemoteBacklogLines", lines);
}

int AgentSettings::turnEndDebounceMs() const
{
    return readInt(ActivityGroup, "TurnEndDebounceMs", 2000);
}

void AgentSettings::setTurnEndDebounceMs(int ms)
{
    writeInt(ActivityGroup, "TurnEndDebounceMs", ms);
}

int AgentSettings::completionDelayMs() const
{
    return readInt(ActivityGroup, "CompletionDelayMs", 300);
}

void AgentSettings::setCompletionDelayMs(int ms)
{
    writeInt(ActivityGroup, "CompletionDelayMs", ms);
}

int AgentSettings::rotationStalenessMs() const
{
    return readInt(OwnershipGroup, "RotationStalenessMs", 3000);
}

void AgentSettings::setRotationStalenessMs(int ms)
{
    writeInt(OwnershipGroup, "RotationStalenessMs", ms);
}

int AgentSettings::arbitrationIntervalMs() const
{
    return readInt(OwnershipGroup, "ArbitrationIntervalMs", 1000);
}

void AgentSettings::setArbitrationIntervalMs(int ms)
{
    writeInt(OwnershipGroup, "ArbitrationIntervalMs", ms);
}

int AgentSettings::staleTimeoutMinutes() const
{
    return readInt(ReaperGroup, "StaleTimeoutMinutes", 10);
}

void AgentSettings::setStaleTimeoutMinutes(int minutes)
{
    writeInt(ReaperGroup, "StaleTimeoutMinutes", minutes);
}

int AgentSettings::reapIntervalMs() const
{
    return readInt(ReaperGroup, "ReapIntervalMs", 60000);
}

void AgentSettings::setReapIntervalMs(int ms)
{
    writeInt(ReaperGroup, "ReapIntervalMs", ms);
}

QString AgentSettings::nodesFile() const
{
    KConfigGroup group(m_config, ClusterGroup);
    return group.readEntry("NodesFile", QDir::homePath() + QStringLiteral("/.pixel-agents/cluster.json"));
}

void AgentSettings::setNodesFile(const QString &path)
{
    KConfigGroup group(m_config, ClusterGroup);
    group.writeEntry("NodesFile", path);
    Q_EMIT settingsChanged();
}

SupervisorConfig AgentSettings::supervisorConfig() const
{
    SupervisorConfig config;
    config.projectsRoot = projectsRoot();
    config.scanIntervalMs = scanIntervalMs();
    config.activityWindowMinutes = activityWindowMinutes();
    config.connectTimeoutSecs = connectTimeoutSecs();
    config.listTimeoutMs = listTimeoutMs();
    config.pollIntervalMs = pollIntervalMs();
    config.remoteBacklogLines = remoteBacklogLines();
    config.turnEndDebounceMs = turnEndDebounceMs();
    config.completionDelayMs = completionDelayMs();
    config.rotationStalenessMs = rotationStalenessMs();
    config.arbitrationIntervalMs = arbitrationIntervalMs();
    config.staleTimeoutMs = qint64(staleTimeoutMinutes()) * 60 * 1000;
    config.reapIntervalMs = reapIntervalMs();
    return config;
}

void AgentSettings::save()
{
    m_config->sync();
}

} // namespace PixelAgents

#include "moc_AgentSettings.cpp"
