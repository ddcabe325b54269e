/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FILETAILER_H
#define FILETAILER_H

#include "pixelagents_export.h"

#include "RemoteShell.h"
#include "SessionFile.h"

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QObject>

class QFileSystemWatcher;
class QProcess;
class QTimer;

namespace PixelAgents
{

/**
 * Splits a byte stream into complete lines, carrying the trailing partial
 * line over to the next append().
 */
class PIXELAGENTS_EXPORT LineBuffer
{
public:
    /**
     * Append @p chunk and return every line it completed, without the
     * terminator (a trailing '\r' is dropped too). Blank lines are skipped.
     */
    QList<QByteArray> append(const QByteArray &chunk);

    QByteArray remainder() const
    {
        return m_remainder;
    }

    void clear()
    {
        m_remainder.clear();
    }

private:
    QByteArray m_remainder;
};

/**
 * FileTailer delivers the lines appended to one owned session file, in
 * write order, each exactly once.
 *
 * LocalFileTailer reads from the filesystem by offset; RemoteFileTailer
 * follows the file through a long-lived ssh "tail -f". Both emit
 * linesReceived() once per batch of newly completed lines.
 */
class PIXELAGENTS_EXPORT FileTailer : public QObject
{
    Q_OBJECT

public:
    explicit FileTailer(const SessionFile &file, QObject *parent = nullptr);
    ~FileTailer() override;

    const SessionFile &file() const
    {
        return m_file;
    }

    virtual void start() = 0;

    /**
     * Stop delivery synchronously. No signal is emitted after this returns.
     */
    virtual void stop() = 0;

    virtual bool isRemote() const = 0;

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * When bytes were last consumed (start time until then)
     */
    QDateTime lastActivity() const
    {
        return m_lastActivity;
    }

    QByteArray lineRemainder() const
    {
        return m_lineBuffer.remainder();
    }

Q_SIGNALS:
    void linesReceived(const QList<QByteArray> &lines);

    /**
     * The underlying stream ended on its own. Terminal for this tailer.
     */
    void closed();

protected:
    void deliver(const QByteArray &chunk);

    SessionFile m_file;
    LineBuffer m_lineBuffer;
    QDateTime m_lastActivity;
    bool m_running = false;
};

/**
 * Tails a local file with two producers feeding one reader: a
 * QFileSystemWatcher for latency and a fixed-interval poll as the
 * correctness backstop. readNewData() is a no-op when the file has not
 * grown past the stored offset, so redundant wake-ups are harmless.
 */
class PIXELAGENTS_EXPORT LocalFileTailer : public FileTailer
{
    Q_OBJECT

public:
    LocalFileTailer(const SessionFile &file, qint64 startOffset, int pollIntervalMs, QObject *parent = nullptr);
    ~LocalFileTailer() override;

    void start() override;
    void stop() override;

    bool isRemote() const override
    {
        return false;
    }

    qint64 byteOffset() const
    {
        return m_offset;
    }

public Q_SLOTS:
    void readNewData();

private:
    void onFileChanged(const QString &path);

    QFileSystemWatcher *m_watcher = nullptr;
    QTimer *m_pollTimer = nullptr;
    qint64 m_offset = 0;
};

/**
 * Follows a file on a remote node with "ssh host tail -f". Losing the
 * connection emits closed(); the tailer never reconnects by itself.
 */
class PIXELAGENTS_EXPORT RemoteFileTailer : public FileTailer
{
    Q_OBJECT

public:
    /**
     * @param backlogLines lines of existing content to replay first,
     *        or -1 to stream the whole file from the start
     */
    RemoteFileTailer(const SessionFile &file, const RemoteShell::Options &options, int backlogLines, QObject *parent = nullptr);
    ~RemoteFileTailer() override;

    void start() override;
    void stop() override;

    bool isRemote() const override
    {
        return true;
    }

    static QString buildTailCommand(const QString &path, int backlogLines);

private:
    void onReadyRead();
    void onReadyReadError();
    void onFinished(int exitCode);

    RemoteShell::Options m_options;
    int m_backlogLines = 0;
    QProcess *m_process = nullptr;
};

} // namespace PixelAgents

#endif // FILETAILER_H
