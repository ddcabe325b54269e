/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionFile.h"

#include <QRegularExpression>

namespace PixelAgents
{

QJsonObject ClusterNode::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("name")] = name;
    obj[QStringLiteral("host")] = address;
    if (isLocal) {
        obj[QStringLiteral("isLocal")] = true;
    }
    return obj;
}

ClusterNode ClusterNode::fromJson(const QJsonObject &obj)
{
    ClusterNode node;
    node.address = obj.value(QStringLiteral("host")).toString().trimmed();
    node.name = obj.value(QStringLiteral("name")).toString().trimmed();
    if (node.name.isEmpty()) {
        node.name = node.address;
    }
    node.isLocal = node.address == QStringLiteral("localhost") || node.address == QStringLiteral("127.0.0.1")
        || obj.value(QStringLiteral("isLocal")).toBool();
    return node;
}

QString SessionFile::identityKey(const QString &nodeName, const QString &path)
{
    return nodeName + QLatin1Char(':') + path;
}

QString SessionFile::sessionId() const
{
    QString name = path.section(QLatin1Char('/'), -1);
    if (name.endsWith(QStringLiteral(".jsonl"))) {
        name.chop(6);
    }
    return name;
}

SessionFile SessionFile::fromPath(const ClusterNode &node, const QString &path)
{
    SessionFile file;
    file.node = node;
    file.path = path;

    static const QRegularExpression projectsPattern(QStringLiteral("\\.claude/projects/([^/]+)/"));
    const QRegularExpressionMatch match = projectsPattern.match(path);

    QString dirName;
    if (match.hasMatch()) {
        dirName = match.captured(1);
        file.projectDir = path.left(match.capturedEnd(1));
    } else {
        const int slash = path.lastIndexOf(QLatin1Char('/'));
        file.projectDir = slash > 0 ? path.left(slash) : QString();
        dirName = file.projectDir.section(QLatin1Char('/'), -1);
    }

    file.projectKey = dirName.isEmpty() ? QStringLiteral("unknown") : projectKeyFromDirName(dirName);
    return file;
}

QString SessionFile::encodeProjectDirName(const QString &workingDirectory)
{
    static const QRegularExpression separators(QStringLiteral("[:\\\\/]"));
    QString name = workingDirectory;
    name.replace(separators, QStringLiteral("-"));
    return name;
}

QString SessionFile::projectKeyFromDirName(const QString &dirName)
{
    QString key = dirName;
    key.replace(QLatin1Char('-'), QLatin1Char('/'));
    return key;
}

QJsonObject SessionFile::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("node")] = node.name;
    obj[QStringLiteral("path")] = path;
    obj[QStringLiteral("projectDir")] = projectDir;
    obj[QStringLiteral("projectKey")] = projectKey;
    return obj;
}

} // namespace PixelAgents
