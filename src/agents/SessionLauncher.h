/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLAUNCHER_H
#define SESSIONLAUNCHER_H

#include "pixelagents_export.h"

#include "RemoteShell.h"
#include "SessionFile.h"

#include <QObject>
#include <QString>

namespace PixelAgents
{

/**
 * SessionLauncher starts new assistant sessions in detached tmux sessions.
 *
 * Every launch pre-declares the session id (--session-id), so the
 * transcript file name is known before it exists and the supervisor can
 * bind the launched agent to exactly that file.
 */
class PIXELAGENTS_EXPORT SessionLauncher : public QObject
{
    Q_OBJECT

public:
    explicit SessionLauncher(QObject *parent = nullptr);
    ~SessionLauncher() override;

    /**
     * Program started inside tmux (default "claude")
     */
    void setProgram(const QString &program)
    {
        m_program = program;
    }

    QString program() const
    {
        return m_program;
    }

    /**
     * Generate a unique tmux session suffix (8 hex characters)
     */
    static QString generateShortId();

    /**
     * Generate a session binding id (UUID without braces)
     */
    static QString generateBindingId();

    static QString buildSessionName(const QString &shortId);

    /**
     * tmux new-session -d -s <name> -c <dir> -- <program> --session-id <id>
     */
    static QString buildLaunchCommand(const QString &sessionName, const QString &workingDirectory, const QString &program, const QString &bindingId);

    /**
     * Launch a session on @p node in @p workingDirectory.
     *
     * @return the binding id the session will write its transcript under.
     *         The outcome is reported by launched() or launchFailed().
     */
    QString launch(const ClusterNode &node, const QString &workingDirectory);

Q_SIGNALS:
    void launched(const PixelAgents::ClusterNode &node, const QString &workingDirectory, const QString &bindingId, const QString &sessionName);
    void launchFailed(const PixelAgents::ClusterNode &node, const QString &bindingId, const QString &error);

private:
    RemoteShell *m_shell = nullptr;
    QString m_program = QStringLiteral("claude");
};

} // namespace PixelAgents

#endif // SESSIONLAUNCHER_H
