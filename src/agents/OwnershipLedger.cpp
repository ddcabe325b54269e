/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OwnershipLedger.h"

#include <algorithm>

namespace PixelAgents
{

bool OwnershipLedger::isClaimed(const SessionFile &file) const
{
    return m_owners.contains(file.identity());
}

int OwnershipLedger::owner(const SessionFile &file) const
{
    return m_owners.value(file.identity(), -1);
}

bool OwnershipLedger::claim(int agentId, const SessionFile &file)
{
    const QString key = file.identity();
    const int current = m_owners.value(key, -1);
    if (current == agentId) {
        return true;
    }
    if (current != -1 || m_retired.contains(key)) {
        return false;
    }
    m_owners.insert(key, agentId);
    return true;
}

void OwnershipLedger::release(const SessionFile &file)
{
    m_owners.remove(file.identity());
}

bool OwnershipLedger::switchFile(int agentId, const SessionFile &oldFile, const SessionFile &newFile)
{
    const QString newKey = newFile.identity();
    const int newOwner = m_owners.value(newKey, -1);
    if ((newOwner != -1 && newOwner != agentId) || m_retired.contains(newKey)) {
        return false;
    }

    if (oldFile.isValid()) {
        const QString oldKey = oldFile.identity();
        if (m_owners.value(oldKey, -1) == agentId) {
            m_owners.remove(oldKey);
        }
        m_ignored[agentId].insert(oldKey);
        m_retired.insert(oldKey);
    }

    m_owners.insert(newKey, agentId);
    return true;
}

void OwnershipLedger::setKnownAtStartup(int agentId, const QList<SessionFile> &files)
{
    QSet<QString> identities;
    for (const SessionFile &file : files) {
        identities.insert(file.identity());
    }
    m_ignored.insert(agentId, identities);
}

void OwnershipLedger::addIgnored(int agentId, const SessionFile &file)
{
    m_ignored[agentId].insert(file.identity());
}

bool OwnershipLedger::isIgnoredFor(int agentId, const SessionFile &file) const
{
    return m_ignored.value(agentId).contains(file.identity());
}

bool OwnershipLedger::isRetired(const SessionFile &file) const
{
    return m_retired.contains(file.identity());
}

void OwnershipLedger::forgetAgent(int agentId)
{
    for (auto it = m_owners.begin(); it != m_owners.end();) {
        if (it.value() == agentId) {
            m_retired.insert(it.key());
            it = m_owners.erase(it);
        } else {
            ++it;
        }
    }
    m_ignored.remove(agentId);
}

bool OwnershipLedger::isAvailableFor(int agentId, const SessionFile &file, const QSet<QString> &taken) const
{
    const QString key = file.identity();
    return !m_owners.contains(key) && !m_retired.contains(key) && !taken.contains(key) && !m_ignored.value(agentId).contains(key);
}

QList<ClaimDecision>
OwnershipLedger::arbitrate(const QList<ClaimCandidate> &candidates, const DirectoryLister &lister, const QDateTime &now, int stalenessMs) const
{
    QList<ClaimDecision> decisions;
    QSet<QString> taken;
    QList<ClaimCandidate> eligible;

    for (const ClaimCandidate &candidate : candidates) {
        // Launched sessions: only the file named after the binding id counts
        if (candidate.currentPath.isEmpty() && !candidate.sessionBindingId.isEmpty()) {
            const QList<SessionListingEntry> entries = lister(candidate.node, candidate.projectDir);
            for (const SessionListingEntry &entry : entries) {
                if (entry.file.sessionId() == candidate.sessionBindingId && isAvailableFor(candidate.agentId, entry.file, taken)) {
                    decisions.append({candidate.agentId, entry.file, false});
                    taken.insert(entry.file.identity());
                    break;
                }
            }
            continue;
        }

        if (!candidate.currentPath.isEmpty()) {
            const bool stale = !candidate.lastActivity.isValid() || candidate.lastActivity.msecsTo(now) > stalenessMs;
            if (!stale) {
                continue;
            }
        }
        eligible.append(candidate);
    }

    auto outranks = [](const ClaimCandidate &a, const ClaimCandidate &b) {
        if (a.lastActivity.isValid() != b.lastActivity.isValid()) {
            return a.lastActivity.isValid();
        }
        if (a.lastActivity != b.lastActivity) {
            return a.lastActivity > b.lastActivity;
        }
        return a.agentId < b.agentId;
    };

    for (const ClaimCandidate &candidate : eligible) {
        bool deferred = false;
        for (const ClaimCandidate &other : eligible) {
            if (other.agentId != candidate.agentId && other.node.name == candidate.node.name && other.projectDir == candidate.projectDir
                && outranks(other, candidate)) {
                deferred = true;
                break;
            }
        }
        if (deferred) {
            continue;
        }

        QList<SessionListingEntry> entries = lister(candidate.node, candidate.projectDir);
        std::stable_sort(entries.begin(), entries.end(), [](const SessionListingEntry &a, const SessionListingEntry &b) {
            if (a.modified.isValid() != b.modified.isValid()) {
                return a.modified.isValid();
            }
            return a.modified > b.modified;
        });

        for (const SessionListingEntry &entry : entries) {
            if (entry.file.path == candidate.currentPath || !isAvailableFor(candidate.agentId, entry.file, taken)) {
                continue;
            }
            decisions.append({candidate.agentId, entry.file, !candidate.currentPath.isEmpty()});
            taken.insert(entry.file.identity());
            break;
        }
    }

    return decisions;
}

} // namespace PixelAgents
