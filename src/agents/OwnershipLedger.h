/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OWNERSHIPLEDGER_H
#define OWNERSHIPLEDGER_H

#include "pixelagents_export.h"

#include "SessionFile.h"
#include "SessionScanner.h"

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>

#include <functional>

namespace PixelAgents
{

/**
 * What the ledger needs to know about an agent to arbitrate for it
 */
struct PIXELAGENTS_EXPORT ClaimCandidate {
    int agentId = -1;
    ClusterNode node;
    QString projectDir;
    QString currentPath; // empty while unbound
    QString sessionBindingId; // empty for adopted sessions
    QDateTime lastActivity;
};

/**
 * Result of one arbitration pass: bind @c file to @c agentId.
 * @c rotation is set when the agent already owned a file and switches away
 * from it.
 */
struct PIXELAGENTS_EXPORT ClaimDecision {
    int agentId = -1;
    SessionFile file;
    bool rotation = false;
};

/**
 * OwnershipLedger maps session files to the agent that owns them.
 *
 * A file has at most one owner. Files an agent switched away from, and
 * files left behind by removed agents, are retired: nobody claims them
 * again. Each agent also has its own ignore set, seeded with the files
 * that already existed in its project directory when it was created.
 *
 * The ledger is not thread safe; the supervisor is its only writer.
 */
class PIXELAGENTS_EXPORT OwnershipLedger
{
public:
    using DirectoryLister = std::function<QList<SessionListingEntry>(const ClusterNode &node, const QString &projectDir)>;

    bool isClaimed(const SessionFile &file) const;

    /**
     * Owning agent id, or -1
     */
    int owner(const SessionFile &file) const;

    /**
     * Claim @p file for @p agentId. Fails if another agent owns it or the
     * file is retired. Claiming a file the agent already owns succeeds.
     */
    bool claim(int agentId, const SessionFile &file);

    void release(const SessionFile &file);

    /**
     * Release and retire @p oldFile, then claim @p newFile, as one step.
     * Nothing changes when @p newFile cannot be claimed.
     */
    bool switchFile(int agentId, const SessionFile &oldFile, const SessionFile &newFile);

    /**
     * Replace the agent's ignore set with the files that existed when it
     * was created
     */
    void setKnownAtStartup(int agentId, const QList<SessionFile> &files);
    void addIgnored(int agentId, const SessionFile &file);
    bool isIgnoredFor(int agentId, const SessionFile &file) const;

    bool isRetired(const SessionFile &file) const;

    /**
     * The scanner must never report @p file as a new session
     */
    bool isKnown(const SessionFile &file) const
    {
        return isClaimed(file) || isRetired(file);
    }

    /**
     * Drop an agent: its claims are released and retired, its ignore set
     * forgotten
     */
    void forgetAgent(int agentId);

    int claimedCount() const
    {
        return m_owners.size();
    }

    /**
     * Decide which unclaimed files get bound to which candidates this cycle.
     *
     * - An unbound agent with a session binding id only looks for
     *   "<projectDir>/<binding id>.jsonl".
     * - A bound agent is only considered once its file has been silent
     *   for longer than @p stalenessMs.
     * - Among eligible agents sharing a project directory, only the one
     *   with the latest activity (lowest id on ties) may claim; the others
     *   wait for the next cycle.
     * - The winner takes the newest file that is unclaimed, not retired,
     *   not in its ignore set and not already handed out in this pass.
     *
     * The ledger itself is not modified.
     */
    QList<ClaimDecision>
    arbitrate(const QList<ClaimCandidate> &candidates, const DirectoryLister &lister, const QDateTime &now, int stalenessMs) const;

private:
    bool isAvailableFor(int agentId, const SessionFile &file, const QSet<QString> &taken) const;

    QHash<QString, int> m_owners; // identity -> agent id
    QHash<int, QSet<QString>> m_ignored; // agent id -> identities
    QSet<QString> m_retired;
};

} // namespace PixelAgents

#endif // OWNERSHIPLEDGER_H
