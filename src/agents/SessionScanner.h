/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSCANNER_H
#define SESSIONSCANNER_H

#include "pixelagents_export.h"

#include "RemoteShell.h"
#include "SessionFile.h"
#include "SupervisorConfig.h"

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QSet>
#include <QTimer>

#include <functional>

namespace PixelAgents
{

/**
 * One session file seen by a listing, with its modification time when the
 * listing provides one.
 */
struct PIXELAGENTS_EXPORT SessionListingEntry {
    SessionFile file;
    QDateTime modified; // invalid when unknown
};

/**
 * SessionScanner periodically lists the session files of one node and
 * reports each file it has never seen before exactly once.
 *
 * Every path the scanner has looked at is remembered for its lifetime,
 * whether it was reported, filtered by the activity window, or already
 * claimed elsewhere. The first scan only reports files modified within the
 * activity window so dormant history isn't adopted at startup.
 */
class PIXELAGENTS_EXPORT SessionScanner : public QObject
{
    Q_OBJECT

public:
    using KnownPredicate = std::function<bool(const SessionFile &file)>;

    SessionScanner(const ClusterNode &node, const SupervisorConfig &config, QObject *parent = nullptr);
    ~SessionScanner() override;

    const ClusterNode &node() const
    {
        return m_node;
    }

    /**
     * Extra filter consulted for unseen paths (claimed by an agent, or in
     * an agent's ignore set). Such paths are remembered and never reported.
     */
    void setKnownPredicate(KnownPredicate predicate);

    /**
     * Scan now, then every scanIntervalMs
     */
    void start();
    void stop();

    bool isRunning() const
    {
        return m_timer->isActive();
    }

    /**
     * Remember @p path without ever reporting it
     */
    void markKnown(const QString &path);
    bool isKnown(const QString &path) const;

    bool initialScanDone() const
    {
        return m_initialScanDone;
    }

    /**
     * Session files currently in @p projectDir on this node, newest first
     * when modification times are known. Used for rotation arbitration.
     */
    virtual QList<SessionListingEntry> projectDirectoryEntries(const QString &projectDir) const = 0;

public Q_SLOTS:
    virtual void scan() = 0;

Q_SIGNALS:
    void sessionDiscovered(const PixelAgents::SessionFile &file, bool initialScan);
    void scanFinished();

protected:
    /**
     * Apply the known-set, predicate and activity window rules to one
     * listing and emit sessionDiscovered() for what survives.
     */
    void processListing(const QList<SessionListingEntry> &entries, const QDateTime &now);

    ClusterNode m_node;
    SupervisorConfig m_config;

private:
    QTimer *m_timer = nullptr;
    KnownPredicate m_knownPredicate;
    QSet<QString> m_knownPaths;
    bool m_initialScanDone = false;
};

/**
 * Lists <projectsRoot>/<project dir>/*.jsonl on the local filesystem.
 */
class PIXELAGENTS_EXPORT LocalSessionScanner : public SessionScanner
{
    Q_OBJECT

public:
    LocalSessionScanner(const ClusterNode &node, const SupervisorConfig &config, QObject *parent = nullptr);

    QString projectsRoot() const
    {
        return m_projectsRoot;
    }

    QList<SessionListingEntry> projectDirectoryEntries(const QString &projectDir) const override;

    /**
     * .jsonl files in @p dir, newest first. Unreadable directories give an
     * empty list.
     */
    static QList<SessionListingEntry> listDirectory(const ClusterNode &node, const QString &dir);

public Q_SLOTS:
    void scan() override;

private:
    QString m_projectsRoot;
};

/**
 * Lists session files on a remote node with one "find" over ssh per scan.
 *
 * The listing only covers files modified within the activity window, so
 * remote rotation arbitration works from the cached result of the last
 * listing rather than an extra round trip.
 */
class PIXELAGENTS_EXPORT RemoteSessionScanner : public SessionScanner
{
    Q_OBJECT

public:
    RemoteSessionScanner(const ClusterNode &node, const SupervisorConfig &config, QObject *parent = nullptr);

    QList<SessionListingEntry> projectDirectoryEntries(const QString &projectDir) const override;

    bool isListingInFlight() const
    {
        return m_listingInFlight;
    }

    static QString buildListCommand(int activityWindowMinutes);

    /**
     * One path per line; blank lines and non-.jsonl paths are dropped
     */
    static QList<SessionListingEntry> parseListing(const QString &output, const ClusterNode &node);

public Q_SLOTS:
    void scan() override;

private:
    void onListingFinished(bool ok, const QString &output);

    RemoteShell *m_shell = nullptr;
    bool m_listingInFlight = false;
    QList<SessionListingEntry> m_lastListing;
};

} // namespace PixelAgents

#endif // SESSIONSCANNER_H
