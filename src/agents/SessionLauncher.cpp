/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionLauncher.h"

#include <QDebug>
#include <QRandomGenerator>
#include <QUuid>

namespace PixelAgents
{

SessionLauncher::SessionLauncher(QObject *parent)
    : QObject(parent)
    , m_shell(new RemoteShell(this))
{
}

SessionLauncher::~SessionLauncher() = default;

QString SessionLauncher::generateShortId()
{
    QString id;
    id.reserve(8);
    for (int i = 0; i < 8; ++i) {
        int r = QRandomGenerator::global()->bounded(16);
        id.append(QLatin1Char(r < 10 ? '0' + r : 'a' + (r - 10)));
    }
    return id;
}

QString SessionLauncher::generateBindingId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString SessionLauncher::buildSessionName(const QString &shortId)
{
    return QStringLiteral("pixelagents-%1").arg(shortId);
}

QString SessionLauncher::buildLaunchCommand(const QString &sessionName, const QString &workingDirectory, const QString &program, const QString &bindingId)
{
    // tmux new-session -d -s <session-name> [-c <dir>] -- <program> --session-id <uuid>
    QStringList args;
    args << QStringLiteral("tmux") << QStringLiteral("new-session") << QStringLiteral("-d");
    args << QStringLiteral("-s") << sessionName;

    if (!workingDirectory.isEmpty()) {
        args << QStringLiteral("-c") << RemoteShell::quote(workingDirectory);
    }

    args << QStringLiteral("--");
    args << program << QStringLiteral("--session-id") << bindingId;

    return args.join(QLatin1Char(' '));
}

QString SessionLauncher::launch(const ClusterNode &node, const QString &workingDirectory)
{
    const QString bindingId = generateBindingId();
    const QString sessionName = buildSessionName(generateShortId());
    const QString command = buildLaunchCommand(sessionName, workingDirectory, m_program, bindingId);

    qDebug() << "SessionLauncher: Launching" << sessionName << "on" << node.name << "in" << workingDirectory;

    m_shell->runAsync(node,
                      command,
                      RemoteShell::Options(),
                      [this, node, workingDirectory, bindingId, sessionName](bool ok, const QString &, const QString &errorOutput) {
        if (ok) {
            Q_EMIT launched(node, workingDirectory, bindingId, sessionName);
        } else {
            const QString error = errorOutput.isEmpty() ? QStringLiteral("tmux new-session failed") : errorOutput;
            qWarning() << "SessionLauncher: Launch failed on" << node.name << error;
            Q_EMIT launchFailed(node, bindingId, error);
        }
    });

    return bindingId;
}

} // namespace PixelAgents

#include "moc_SessionLauncher.cpp"
