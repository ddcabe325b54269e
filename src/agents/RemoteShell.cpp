/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RemoteShell.h"

#include <QDebug>
#include <QSharedPointer>
#include <QTimer>

namespace PixelAgents
{

RemoteShell::RemoteShell(QObject *parent)
    : QObject(parent)
{
}

RemoteShell::~RemoteShell()
{
    // Outstanding commands must not call back into a half-destroyed owner
    const auto processes = findChildren<QProcess *>(QString(), Qt::FindDirectChildrenOnly);
    for (QProcess *process : processes) {
        process->disconnect();
        process->kill();
    }
}

QString RemoteShell::program(const ClusterNode &node)
{
    return node.isLocal ? QStringLiteral("/bin/sh") : QStringLiteral("ssh");
}

QStringList RemoteShell::buildArguments(const ClusterNode &node, const QString &command, const Options &options)
{
    if (node.isLocal) {
        return {QStringLiteral("-c"), command};
    }

    QStringList args;
    args << QStringLiteral("-o") << QStringLiteral("BatchMode=yes");
    args << QStringLiteral("-o") << QStringLiteral("ConnectTimeout=%1").arg(options.connectTimeoutSecs);
    if (options.serverAliveIntervalSecs > 0) {
        args << QStringLiteral("-o") << QStringLiteral("ServerAliveInterval=%1").arg(options.serverAliveIntervalSecs);
    }
    args << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=no");
    args << (node.address.isEmpty() ? node.name : node.address);
    args << command;
    return args;
}

QString RemoteShell::quote(const QString &value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
    return QLatin1Char('\'') + escaped + QLatin1Char('\'');
}

void RemoteShell::runAsync(const ClusterNode &node, const QString &command, const Options &options, Callback callback)
{
    auto *process = new QProcess(this);
    auto done = QSharedPointer<bool>::create(false);
    ++m_pending;

    auto finish = [this, process, callback, done](bool ok) {
        if (*done) {
            return;
        }
        *done = true;
        --m_pending;

        const QString output = QString::fromUtf8(process->readAllStandardOutput());
        const QString errorOutput = QString::fromUtf8(process->readAllStandardError()).trimmed();
        if (!ok && !errorOutput.isEmpty()) {
            Q_EMIT errorOccurred(errorOutput);
        }
        if (callback) {
            callback(ok, output, errorOutput);
        }
        process->deleteLater();
    };

    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [finish](int exitCode, QProcess::ExitStatus status) {
        finish(status == QProcess::NormalExit && exitCode == 0);
    });
    connect(process, &QProcess::errorOccurred, this, [finish, node](QProcess::ProcessError error) {
        // Crashes and timeouts also deliver finished(); only a failed start doesn't
        if (error == QProcess::FailedToStart) {
            qWarning() << "RemoteShell: Failed to start command for node" << node.name;
            finish(false);
        }
    });

    if (options.commandTimeoutMs > 0) {
        QTimer::singleShot(options.commandTimeoutMs, process, [process, node]() {
            if (process->state() != QProcess::NotRunning) {
                qDebug() << "RemoteShell: Command timed out on node" << node.name;
                process->kill();
            }
        });
    }

    process->start(program(node), buildArguments(node, command, options));
}

} // namespace PixelAgents

#include "moc_RemoteShell.cpp"
