/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "NodeRegistry.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <QSysInfo>

namespace PixelAgents
{

NodeRegistry::NodeRegistry()
    : m_nodes(defaultNodes())
{
}

bool NodeRegistry::load(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        qDebug() << "NodeRegistry: No cluster file at" << path << "- using local node only";
        m_nodes = defaultNodes();
        return false;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "NodeRegistry: Failed to open" << path << file.errorString();
        m_nodes = defaultNodes();
        return false;
    }

    bool ok = false;
    const QList<ClusterNode> parsed = parseNodes(file.readAll(), &ok);
    if (!ok || parsed.isEmpty()) {
        qWarning() << "NodeRegistry: No usable nodes in" << path << "- using local node only";
        m_nodes = defaultNodes();
        return false;
    }

    m_nodes = parsed;
    qDebug() << "NodeRegistry: Loaded" << m_nodes.size() << "node(s) from" << path;
    return true;
}

ClusterNode NodeRegistry::node(const QString &name) const
{
    for (const ClusterNode &node : m_nodes) {
        if (node.name == name) {
            return node;
        }
    }
    return ClusterNode();
}

QList<ClusterNode> NodeRegistry::parseNodes(const QByteArray &json, bool *ok)
{
    if (ok) {
        *ok = false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "NodeRegistry: Failed to parse cluster file:" << error.errorString();
        return {};
    }

    QList<ClusterNode> nodes;
    QSet<QString> seen;

    const QJsonArray array = doc.object().value(QStringLiteral("nodes")).toArray();
    for (const QJsonValue &value : array) {
        ClusterNode node = ClusterNode::fromJson(value.toObject());
        if (node.isLocal && node.address.isEmpty()) {
            node.address = QStringLiteral("localhost");
        }
        if (node.address.isEmpty() || !node.isValid()) {
            continue;
        }
        if (seen.contains(node.name)) {
            qWarning() << "NodeRegistry: Duplicate node name" << node.name << "ignored";
            continue;
        }
        seen.insert(node.name);
        nodes.append(node);
    }

    if (ok) {
        *ok = true;
    }
    return nodes;
}

QList<ClusterNode> NodeRegistry::defaultNodes()
{
    ClusterNode local;
    local.name = localHostName();
    local.address = QStringLiteral("localhost");
    local.isLocal = true;
    return {local};
}

QString NodeRegistry::localHostName()
{
    QString name = QSysInfo::machineHostName();
    if (name.endsWith(QStringLiteral(".local"))) {
        name.chop(6);
    }
    return name.isEmpty() ? QStringLiteral("localhost") : name;
}

} // namespace PixelAgents
