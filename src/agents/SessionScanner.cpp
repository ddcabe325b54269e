/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionScanner.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

namespace PixelAgents
{

SessionScanner::SessionScanner(const ClusterNode &node, const SupervisorConfig &config, QObject *parent)
    : QObject(parent)
    , m_node(node)
    , m_config(config)
    , m_timer(new QTimer(this))
{
    m_timer->setInterval(m_config.scanIntervalMs);
    connect(m_timer, &QTimer::timeout, this, &SessionScanner::scan);
}

SessionScanner::~SessionScanner() = default;

void SessionScanner::setKnownPredicate(KnownPredicate predicate)
{
    m_knownPredicate = std::move(predicate);
}

void SessionScanner::start()
{
    if (m_timer->isActive()) {
        return;
    }
    m_timer->start();
    QTimer::singleShot(0, this, &SessionScanner::scan);
}

void SessionScanner::stop()
{
    m_timer->stop();
}

void SessionScanner::markKnown(const QString &path)
{
    m_knownPaths.insert(path);
}

bool SessionScanner::isKnown(const QString &path) const
{
    return m_knownPaths.contains(path);
}

void SessionScanner::processListing(const QList<SessionListingEntry> &entries, const QDateTime &now)
{
    const bool initialScan = !m_initialScanDone;
    const QDateTime cutoff = now.addSecs(-60 * qint64(m_config.activityWindowMinutes));

    for (const SessionListingEntry &entry : entries) {
        const QString &path = entry.file.path;
        if (m_knownPaths.contains(path)) {
            continue;
        }
        // Remembered before any other check: a file is considered once
        m_knownPaths.insert(path);

        if (m_knownPredicate && m_knownPredicate(entry.file)) {
            continue;
        }

        if (initialScan && entry.modified.isValid() && entry.modified < cutoff) {
            continue;
        }

        qDebug() << "SessionScanner: Discovered" << entry.file.identity() << (initialScan ? "(initial scan)" : "");
        Q_EMIT sessionDiscovered(entry.file, initialScan);
    }

    m_initialScanDone = true;
    Q_EMIT scanFinished();
}

// ---------------------------------------------------------------------------

LocalSessionScanner::LocalSessionScanner(const ClusterNode &node, const SupervisorConfig &config, QObject *parent)
    : SessionScanner(node, config, parent)
    , m_projectsRoot(config.effectiveProjectsRoot())
{
}

QList<SessionListingEntry> LocalSessionScanner::listDirectory(const ClusterNode &node, const QString &dir)
{
    QList<SessionListingEntry> entries;

    const QDir directory(dir);
    if (!directory.exists()) {
        return entries;
    }

    const QFileInfoList files = directory.entryInfoList({QStringLiteral("*.jsonl")}, QDir::Files | QDir::Readable, QDir::Time);
    entries.reserve(files.size());
    for (const QFileInfo &info : files) {
        SessionListingEntry entry;
        entry.file = SessionFile::fromPath(node, info.absoluteFilePath());
        entry.modified = info.lastModified();
        entries.append(entry);
    }
    return entries;
}

QList<SessionListingEntry> LocalSessionScanner::projectDirectoryEntries(const QString &projectDir) const
{
    return listDirectory(m_node, projectDir);
}

void LocalSessionScanner::scan()
{
    QList<SessionListingEntry> entries;

    const QDir root(m_projectsRoot);
    if (root.exists()) {
        const QStringList projectDirs = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Readable, QDir::Name);
        for (const QString &projectDir : projectDirs) {
            entries.append(listDirectory(m_node, root.absoluteFilePath(projectDir)));
        }
    }

    processListing(entries, QDateTime::currentDateTime());
}

// ---------------------------------------------------------------------------

RemoteSessionScanner::RemoteSessionScanner(const ClusterNode &node, const SupervisorConfig &config, QObject *parent)
    : SessionScanner(node, config, parent)
    , m_shell(new RemoteShell(this))
{
}

QString RemoteSessionScanner::buildListCommand(int activityWindowMinutes)
{
    // find exits non-zero when the projects directory doesn't exist yet
    return QStringLiteral("find ~/.claude/projects -name \"*.jsonl\" -mmin -%1 2>/dev/null || true").arg(activityWindowMinutes);
}

QList<SessionListingEntry> RemoteSessionScanner::parseListing(const QString &output, const ClusterNode &node)
{
    QList<SessionListingEntry> entries;

    const QStringList lines = output.split(QLatin1Char('\n'));
    for (const QString &rawLine : lines) {
        const QString path = rawLine.trimmed();
        if (path.isEmpty() || !path.endsWith(QStringLiteral(".jsonl"))) {
            continue;
        }
        SessionListingEntry entry;
        entry.file = SessionFile::fromPath(node, path);
        entries.append(entry);
    }
    return entries;
}

QList<SessionListingEntry> RemoteSessionScanner::projectDirectoryEntries(const QString &projectDir) const
{
    // Match on the directory name: launched sessions only know "~/..."
    const QString dirName = projectDir.section(QLatin1Char('/'), -1, -1, QString::SectionSkipEmpty);

    QList<SessionListingEntry> entries;
    for (const SessionListingEntry &entry : m_lastListing) {
        if (entry.file.projectDir.section(QLatin1Char('/'), -1, -1, QString::SectionSkipEmpty) == dirName) {
            entries.append(entry);
        }
    }
    return entries;
}

void RemoteSessionScanner::scan()
{
    // One listing per node at a time; a slow host just skips cycles
    if (m_listingInFlight) {
        return;
    }
    m_listingInFlight = true;

    RemoteShell::Options options;
    options.connectTimeoutSecs = m_config.connectTimeoutSecs;
    options.commandTimeoutMs = m_config.listTimeoutMs;

    m_shell->runAsync(m_node, buildListCommand(m_config.activityWindowMinutes), options, [this](bool ok, const QString &output, const QString &) {
        onListingFinished(ok, output);
    });
}

void RemoteSessionScanner::onListingFinished(bool ok, const QString &output)
{
    m_listingInFlight = false;

    if (!ok) {
        // Unreachable or timed out: try again next cycle
        qDebug() << "SessionScanner: Listing failed on node" << m_node.name;
        return;
    }

    m_lastListing = parseListing(output, m_node);
    processListing(m_lastListing, QDateTime::currentDateTime());
}

} // namespace PixelAgents

#include "moc_SessionScanner.cpp"
