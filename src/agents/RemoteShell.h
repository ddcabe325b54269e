/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef REMOTESHELL_H
#define REMOTESHELL_H

#include "pixelagents_export.h"

#include "SessionFile.h"

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

namespace PixelAgents
{

/**
 * RemoteShell runs shell commands on cluster nodes.
 *
 * Remote nodes are reached with non-interactive ssh (BatchMode, short
 * ConnectTimeout); local nodes run the same command through /bin/sh so
 * callers don't need to care where a node lives. Commands are always
 * asynchronous and bounded by an overall timeout that kills the process,
 * so an unreachable node never stalls the event loop.
 */
class PIXELAGENTS_EXPORT RemoteShell : public QObject
{
    Q_OBJECT

public:
    struct Options {
        int connectTimeoutSecs = 3;
        int commandTimeoutMs = 10000; // 0 = no overall timeout (streams)
        int serverAliveIntervalSecs = 0; // 0 = ssh default
    };

    explicit RemoteShell(QObject *parent = nullptr);
    ~RemoteShell() override;

    /**
     * Program and arguments that run @p command on @p node.
     *
     * Remote: ssh -o BatchMode=yes -o ConnectTimeout=N ... <address> <command>
     * Local:  /bin/sh -c <command>
     */
    static QString program(const ClusterNode &node);
    static QStringList buildArguments(const ClusterNode &node, const QString &command, const Options &options);

    /**
     * Single-quote @p value for a POSIX shell
     */
    static QString quote(const QString &value);

    using Callback = std::function<void(bool ok, const QString &output, const QString &errorOutput)>;

    /**
     * Run @p command on @p node. The callback receives ok=false when the
     * process failed to start, timed out, or exited non-zero (ssh uses 255
     * for connection failures), together with that command's own stderr.
     */
    void runAsync(const ClusterNode &node, const QString &command, const Options &options, Callback callback);

    /**
     * Number of commands started by runAsync() that have not finished yet
     */
    int pendingCount() const
    {
        return m_pending;
    }

Q_SIGNALS:
    /**
     * Emitted with stderr output of a failed command
     */
    void errorOccurred(const QString &message);

private:
    int m_pending = 0;
};

} // namespace PixelAgents

#endif // REMOTESHELL_H
