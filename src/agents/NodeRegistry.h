/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NODEREGISTRY_H
#define NODEREGISTRY_H

#include "pixelagents_export.h"

#include "SessionFile.h"

#include <QByteArray>
#include <QList>
#include <QString>

namespace PixelAgents
{

/**
 * NodeRegistry holds the compute nodes sessions are discovered on.
 *
 * The list comes from a JSON file:
 *
 *   {"nodes": [{"name": "gpu1", "host": "user@gpu1"}, {"host": "localhost"}]}
 *
 * When the file is missing or unusable the registry falls back to a single
 * local node named after this machine.
 */
class PIXELAGENTS_EXPORT NodeRegistry
{
public:
    NodeRegistry();

    /**
     * Load nodes from @p path. Returns false (and keeps the default local
     * node) when the file can't be read or lists no usable node.
     */
    bool load(const QString &path);

    QList<ClusterNode> nodes() const
    {
        return m_nodes;
    }

    /**
     * Node by name, or an invalid node
     */
    ClusterNode node(const QString &name) const;

    /**
     * Parse a cluster file. Entries without a host are skipped, duplicate
     * names keep the first entry.
     */
    static QList<ClusterNode> parseNodes(const QByteArray &json, bool *ok = nullptr);

    static QList<ClusterNode> defaultNodes();

    /**
     * Machine host name without a trailing ".local"
     */
    static QString localHostName();

private:
    QList<ClusterNode> m_nodes;
};

} // namespace PixelAgents

#endif // NODEREGISTRY_H
