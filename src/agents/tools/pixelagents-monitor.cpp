/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    pixelagents-monitor - print agent activity as JSON lines

    Discovers assistant sessions on every configured node and writes one
    compact JSON object per lifecycle or activity notification to stdout.

    Usage:
        pixelagents-monitor [--nodes <file>] [--projects-root <dir>] [--launch <dir>]
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include "AgentSettings.h"
#include "AgentSupervisor.h"
#include "NodeRegistry.h"
#include "SessionLauncher.h"

using namespace PixelAgents;

namespace
{

void writeEvent(const QJsonObject &event)
{
    QTextStream out(stdout);
    out << QJsonDocument(event).toJson(QJsonDocument::Compact) << "\n";
    out.flush();
}

QJsonObject makeEvent(const QString &type, int agentId)
{
    QJsonObject event;
    event[QStringLiteral("type")] = type;
    event[QStringLiteral("id")] = agentId;
    return event;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("pixelagents-monitor"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Track assistant sessions across cluster nodes"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption nodesOption(QStringList() << QStringLiteral("n") << QStringLiteral("nodes"),
                                   QStringLiteral("Cluster node list (JSON), overrides the configured file"),
                                   QStringLiteral("file"));
    parser.addOption(nodesOption);

    QCommandLineOption projectsRootOption(QStringList() << QStringLiteral("r") << QStringLiteral("projects-root"),
                                          QStringLiteral("Local session root (default: ~/.claude/projects)"),
                                          QStringLiteral("dir"));
    parser.addOption(projectsRootOption);

    QCommandLineOption launchOption(QStringList() << QStringLiteral("l") << QStringLiteral("launch"),
                                    QStringLiteral("Launch a new session in this directory on the first node"),
                                    QStringLiteral("dir"));
    parser.addOption(launchOption);

    parser.process(app);

    AgentSettings settings;
    SupervisorConfig config = settings.supervisorConfig();
    if (parser.isSet(projectsRootOption)) {
        config.projectsRoot = parser.value(projectsRootOption);
    }

    NodeRegistry registry;
    registry.load(parser.isSet(nodesOption) ? parser.value(nodesOption) : settings.nodesFile());

    AgentSupervisor supervisor(config);
    supervisor.setNodes(registry.nodes());

    QObject::connect(&supervisor, &AgentSupervisor::agentCreated, [](int id, const QString &nodeName, const QString &projectKey) {
        QJsonObject event = makeEvent(QStringLiteral("agentCreated"), id);
        event[QStringLiteral("node")] = nodeName;
        event[QStringLiteral("projectKey")] = projectKey;
        writeEvent(event);
    });
    QObject::connect(&supervisor, &AgentSupervisor::agentRemoved, [](int id) {
        writeEvent(makeEvent(QStringLiteral("agentRemoved"), id));
    });
    QObject::connect(&supervisor, &AgentSupervisor::operationStarted, [](int id, const QString &operationId, const QString &label) {
        QJsonObject event = makeEvent(QStringLiteral("operationStarted"), id);
        event[QStringLiteral("operationId")] = operationId;
        event[QStringLiteral("label")] = label;
        writeEvent(event);
    });
    QObject::connect(&supervisor, &AgentSupervisor::operationCompleted, [](int id, const QString &operationId) {
        QJsonObject event = makeEvent(QStringLiteral("operationCompleted"), id);
        event[QStringLiteral("operationId")] = operationId;
        writeEvent(event);
    });
    QObject::connect(&supervisor, &AgentSupervisor::operationsCleared, [](int id) {
        writeEvent(makeEvent(QStringLiteral("operationsCleared"), id));
    });
    QObject::connect(&supervisor, &AgentSupervisor::activityChanged, [](int id, ActivityStateMachine::State state) {
        QJsonObject event = makeEvent(QStringLiteral("activityChanged"), id);
        event[QStringLiteral("state")] = state == ActivityStateMachine::State::Waiting ? QStringLiteral("waiting") : QStringLiteral("active");
        writeEvent(event);
    });

    SessionLauncher launcher;
    if (parser.isSet(launchOption)) {
        const ClusterNode node = registry.nodes().constFirst();
        const QString workingDirectory = parser.value(launchOption);

        // Register before the session can write its first line
        const QString bindingId = launcher.launch(node, workingDirectory);
        const int agentId = supervisor.registerLaunchedSession(node, workingDirectory, bindingId);

        QObject::connect(&launcher, &SessionLauncher::launchFailed, &supervisor, [&supervisor, agentId](const ClusterNode &node, const QString &, const QString &error) {
            QTextStream err(stderr);
            err << "Error: launch on " << node.name << " failed: " << error << "\n";
            supervisor.closeAgent(agentId);
        });
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &supervisor, [&supervisor]() {
        supervisor.stop();
    });

    supervisor.start();
    return app.exec();
}
