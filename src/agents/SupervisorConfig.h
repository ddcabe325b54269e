/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SUPERVISORCONFIG_H
#define SUPERVISORCONFIG_H

#include "pixelagents_export.h"

#include <QDir>
#include <QString>

namespace PixelAgents
{

/**
 * Tunables shared by the scanners, tailers, activity tracking and the
 * supervisor. AgentSettings produces one from the user's config file;
 * tests build one directly with short intervals.
 */
struct PIXELAGENTS_EXPORT SupervisorConfig {
    // Discovery
    QString projectsRoot; // empty = ~/.claude/projects
    int scanIntervalMs = 3000;
    int activityWindowMinutes = 10;

    // Remote command execution
    int connectTimeoutSecs = 3;
    int listTimeoutMs = 10000;
    int streamConnectTimeoutSecs = 5;
    int serverAliveIntervalSecs = 30;
    int remoteBacklogLines = 50;

    // Local tailing backstop
    int pollIntervalMs = 2000;

    // Activity timing
    int turnEndDebounceMs = 2000;
    int completionDelayMs = 300;

    // File ownership
    int rotationStalenessMs = 3000;
    int arbitrationIntervalMs = 1000;

    // Staleness reaper (local agents only)
    qint64 staleTimeoutMs = 10 * 60 * 1000;
    int reapIntervalMs = 60000;

    static QString defaultProjectsRoot()
    {
        return QDir::homePath() + QStringLiteral("/.claude/projects");
    }

    QString effectiveProjectsRoot() const
    {
        return projectsRoot.isEmpty() ? defaultProjectsRoot() : projectsRoot;
    }
};

} // namespace PixelAgents

#endif // SUPERVISORCONFIG_H
