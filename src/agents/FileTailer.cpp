/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FileTailer.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QProcess>
#include <QTimer>

namespace PixelAgents
{

QList<QByteArray> LineBuffer::append(const QByteArray &chunk)
{
    QList<QByteArray> lines;
    if (chunk.isEmpty()) {
        return lines;
    }

    QByteArray data = m_remainder + chunk;
    int start = 0;
    int newline = data.indexOf('\n', start);
    while (newline >= 0) {
        QByteArray line = data.mid(start, newline - start);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (!line.trimmed().isEmpty()) {
            lines.append(line);
        }
        start = newline + 1;
        newline = data.indexOf('\n', start);
    }

    m_remainder = data.mid(start);
    return lines;
}

FileTailer::FileTailer(const SessionFile &file, QObject *parent)
    : QObject(parent)
    , m_file(file)
    , m_lastActivity(QDateTime::currentDateTimeUtc())
{
}

FileTailer::~FileTailer() = default;

void FileTailer::deliver(const QByteArray &chunk)
{
    if (chunk.isEmpty()) {
        return;
    }

    m_lastActivity = QDateTime::currentDateTimeUtc();
    const QList<QByteArray> lines = m_lineBuffer.append(chunk);
    if (!lines.isEmpty()) {
        Q_EMIT linesReceived(lines);
    }
}

// ---------------------------------------------------------------------------

LocalFileTailer::LocalFileTailer(const SessionFile &file, qint64 startOffset, int pollIntervalMs, QObject *parent)
    : FileTailer(file, parent)
    , m_watcher(new QFileSystemWatcher(this))
    , m_pollTimer(new QTimer(this))
    , m_offset(qMax<qint64>(0, startOffset))
{
    m_pollTimer->setInterval(pollIntervalMs);
    connect(m_pollTimer, &QTimer::timeout, this, &LocalFileTailer::readNewData);
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &LocalFileTailer::onFileChanged);
}

LocalFileTailer::~LocalFileTailer()
{
    stop();
}

void LocalFileTailer::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    if (!m_watcher->addPath(m_file.path)) {
        // The poll timer still covers this file
        qWarning() << "LocalFileTailer: Cannot watch" << m_file.path;
    }
    m_pollTimer->start();

    // Pick up anything written between discovery and now
    QMetaObject::invokeMethod(this, &LocalFileTailer::readNewData, Qt::QueuedConnection);
}

void LocalFileTailer::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    m_pollTimer->stop();
    const QStringList watched = m_watcher->files();
    if (!watched.isEmpty()) {
        m_watcher->removePaths(watched);
    }
}

void LocalFileTailer::onFileChanged(const QString &path)
{
    // Some writers replace the file, which drops it from the watcher
    if (m_running && !m_watcher->files().contains(path) && QFileInfo::exists(path)) {
        m_watcher->addPath(path);
    }
    readNewData();
}

void LocalFileTailer::readNewData()
{
    if (!m_running) {
        return;
    }

    QFile file(m_file.path);
    if (!file.open(QIODevice::ReadOnly)) {
        qDebug() << "LocalFileTailer: Cannot open" << m_file.path << file.errorString();
        return;
    }

    // Nothing new (or the file shrank): leave the offset where it is
    const qint64 size = file.size();
    if (size <= m_offset) {
        return;
    }

    if (!file.seek(m_offset)) {
        qDebug() << "LocalFileTailer: Cannot seek" << m_file.path << "to" << m_offset;
        return;
    }

    const QByteArray chunk = file.read(size - m_offset);
    if (chunk.isEmpty()) {
        qDebug() << "LocalFileTailer: Read failed for" << m_file.path << file.errorString();
        return;
    }

    // Advance before delivering so a re-entrant call sees the new offset
    m_offset += chunk.size();
    deliver(chunk);
}

// ---------------------------------------------------------------------------

RemoteFileTailer::RemoteFileTailer(const SessionFile &file, const RemoteShell::Options &options, int backlogLines, QObject *parent)
    : FileTailer(file, parent)
    , m_options(options)
    , m_backlogLines(backlogLines)
{
    // The stream runs until the connection drops
    m_options.commandTimeoutMs = 0;
}

RemoteFileTailer::~RemoteFileTailer()
{
    stop();
}

QString RemoteFileTailer::buildTailCommand(const QString &path, int backlogLines)
{
    const QString lines = backlogLines < 0 ? QStringLiteral("+1") : QString::number(backlogLines);
    return QStringLiteral("tail -f -n %1 %2 2>/dev/null").arg(lines, RemoteShell::quote(path));
}

void RemoteFileTailer::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    m_process = new QProcess(this);
    connect(m_process, &QProcess::readyReadStandardOutput, this, &RemoteFileTailer::onReadyRead);
    connect(m_process, &QProcess::readyReadStandardError, this, &RemoteFileTailer::onReadyReadError);
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this](int exitCode, QProcess::ExitStatus) {
        onFinished(exitCode);
    });
    connect(m_process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            qWarning() << "RemoteFileTailer: Failed to start stream for" << m_file.identity();
            onFinished(-1);
        }
    });

    const QString command = buildTailCommand(m_file.path, m_backlogLines);
    qDebug() << "RemoteFileTailer: Streaming" << m_file.identity();
    m_process->start(RemoteShell::program(m_file.node), RemoteShell::buildArguments(m_file.node, command, m_options));
}

void RemoteFileTailer::stop()
{
    if (!m_process) {
        m_running = false;
        return;
    }
    m_running = false;

    QProcess *process = m_process;
    m_process = nullptr;
    process->disconnect(this);
    if (process->state() != QProcess::NotRunning) {
        process->kill();
    }
    process->deleteLater();
}

void RemoteFileTailer::onReadyRead()
{
    if (!m_process) {
        return;
    }
    deliver(m_process->readAllStandardOutput());
}

void RemoteFileTailer::onReadyReadError()
{
    if (!m_process) {
        return;
    }

    const QString errorOutput = QString::fromUtf8(m_process->readAllStandardError());
    const QStringList lines = errorOutput.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        // ssh prints "Warning: Permanently added ..." on first contact
        if (!line.trimmed().startsWith(QStringLiteral("Warning:"))) {
            qDebug() << "RemoteFileTailer:" << m_file.node.name << line.trimmed();
        }
    }
}

void RemoteFileTailer::onFinished(int exitCode)
{
    if (!m_running) {
        return;
    }

    // Drain anything still buffered before reporting the close
    if (m_process) {
        deliver(m_process->readAllStandardOutput());
        m_process->deleteLater();
        m_process = nullptr;
    }
    m_running = false;

    qDebug() << "RemoteFileTailer: Stream closed for" << m_file.identity() << "exit code" << exitCode;
    Q_EMIT closed();
}

} // namespace PixelAgents

#include "moc_FileTailer.cpp"
