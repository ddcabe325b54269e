/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONFILE_H
#define SESSIONFILE_H

#include "pixelagents_export.h"

#include <QJsonObject>
#include <QMetaType>
#include <QString>

namespace PixelAgents
{

/**
 * A compute node sessions are discovered on.
 *
 * Identity is the name. Local nodes are scanned through the filesystem,
 * remote ones through ssh.
 */
class PIXELAGENTS_EXPORT ClusterNode
{
public:
    QString name;
    QString address; // ssh destination (e.g. "user@host"), "localhost" for local
    bool isLocal = false;

    bool isValid() const
    {
        return !name.isEmpty();
    }

    QJsonObject toJson() const;
    static ClusterNode fromJson(const QJsonObject &obj);

    bool operator==(const ClusterNode &other) const
    {
        return name == other.name;
    }
};

/**
 * A session transcript file on a node.
 *
 * Identity is (node name, path). The project key is informational only and
 * must never be used to decide ownership.
 */
class PIXELAGENTS_EXPORT SessionFile
{
public:
    ClusterNode node;
    QString path; // absolute path of the .jsonl file on its node
    QString projectDir; // directory holding the file (one per project)
    QString projectKey; // decoded working directory, for display/grouping

    bool isValid() const
    {
        return node.isValid() && !path.isEmpty();
    }

    /**
     * Key used by the scanner and the ownership ledger: "<node>:<path>"
     */
    QString identity() const
    {
        return identityKey(node.name, path);
    }

    static QString identityKey(const QString &nodeName, const QString &path);

    /**
     * File name without the .jsonl suffix. For sessions started with a
     * pre-declared id this is that id.
     */
    QString sessionId() const;

    /**
     * Build a SessionFile for a path, deriving the project directory from
     * the component after ".claude/projects/" (or the parent directory when
     * the path is laid out differently).
     */
    static SessionFile fromPath(const ClusterNode &node, const QString &path);

    /**
     * C:\Users\Dev\Arcadia -> C--Users-Dev-Arcadia, /home/u/app -> -home-u-app
     */
    static QString encodeProjectDirName(const QString &workingDirectory);

    /**
     * -home-u-app -> /home/u/app
     */
    static QString projectKeyFromDirName(const QString &dirName);

    QJsonObject toJson() const;

    bool operator==(const SessionFile &other) const
    {
        return node.name == other.node.name && path == other.path;
    }
};

} // namespace PixelAgents

Q_DECLARE_METATYPE(PixelAgents::ClusterNode)
Q_DECLARE_METATYPE(PixelAgents::SessionFile)

#endif // SESSIONFILE_H
