/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptParser.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace PixelAgents
{

ActivityEvent ActivityEvent::operationStarted(const QString &id, const QString &label)
{
    ActivityEvent event;
    event.kind = Kind::OperationStarted;
    event.operationId = id;
    event.label = label;
    return event;
}

ActivityEvent ActivityEvent::operationCompleted(const QString &id)
{
    ActivityEvent event;
    event.kind = Kind::OperationCompleted;
    event.operationId = id;
    return event;
}

ActivityEvent ActivityEvent::turnEnded(bool debounced)
{
    ActivityEvent event;
    event.kind = Kind::TurnEnded;
    event.debounced = debounced;
    return event;
}

ActivityEvent ActivityEvent::newPrompt()
{
    ActivityEvent event;
    event.kind = Kind::NewPrompt;
    return event;
}

ActivityEvent ActivityEvent::ignored()
{
    return ActivityEvent();
}

QList<ActivityEvent> TranscriptParser::parseLine(const QByteArray &line)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return {ActivityEvent::ignored()};
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return {ActivityEvent::ignored()};
    }

    const QJsonObject record = doc.object();
    const QString type = record.value(QStringLiteral("type")).toString();

    if (type == QStringLiteral("assistant")) {
        return parseAssistantRecord(record);
    }
    if (type == QStringLiteral("user")) {
        return parseUserRecord(record);
    }
    if (type == QStringLiteral("system") && record.value(QStringLiteral("subtype")).toString() == QStringLiteral("turn_duration")) {
        // Authoritative end of turn
        return {ActivityEvent::turnEnded(false)};
    }

    return {ActivityEvent::ignored()};
}

QList<ActivityEvent> TranscriptParser::parseAssistantRecord(const QJsonObject &record)
{
    const QJsonValue content = record.value(QStringLiteral("message")).toObject().value(QStringLiteral("content"));
    if (!content.isArray()) {
        return {ActivityEvent::ignored()};
    }

    const QJsonArray blocks = content.toArray();
    QList<ActivityEvent> events;
    bool hasToolUse = false;
    bool hasText = false;

    for (const QJsonValue &value : blocks) {
        const QJsonObject block = value.toObject();
        const QString blockType = block.value(QStringLiteral("type")).toString();

        if (blockType == QStringLiteral("tool_use")) {
            hasToolUse = true;
            const QString id = block.value(QStringLiteral("id")).toString();
            if (!id.isEmpty()) {
                const QString label = formatOperationLabel(block.value(QStringLiteral("name")).toString(), block.value(QStringLiteral("input")).toObject());
                events.append(ActivityEvent::operationStarted(id, label));
            }
        } else if (blockType == QStringLiteral("text")) {
            hasText = true;
        }
    }

    // Tool invocations win over any text in the same record
    if (hasToolUse) {
        return events.isEmpty() ? QList<ActivityEvent>{ActivityEvent::ignored()} : events;
    }

    // Text-only records are often followed by a tool_use record for the same
    // turn, so they only arm the debounce. Thinking-only records are ignored.
    if (hasText) {
        return {ActivityEvent::turnEnded(true)};
    }
    return {ActivityEvent::ignored()};
}

QList<ActivityEvent> TranscriptParser::parseUserRecord(const QJsonObject &record)
{
    const QJsonValue content = record.value(QStringLiteral("message")).toObject().value(QStringLiteral("content"));

    if (content.isString()) {
        if (content.toString().trimmed().isEmpty()) {
            return {ActivityEvent::ignored()};
        }
        return {ActivityEvent::newPrompt()};
    }

    if (!content.isArray()) {
        return {ActivityEvent::ignored()};
    }

    QList<ActivityEvent> events;
    bool hasToolResult = false;

    const QJsonArray blocks = content.toArray();
    for (const QJsonValue &value : blocks) {
        const QJsonObject block = value.toObject();
        if (block.value(QStringLiteral("type")).toString() != QStringLiteral("tool_result")) {
            continue;
        }
        hasToolResult = true;
        const QString toolUseId = block.value(QStringLiteral("tool_use_id")).toString();
        if (!toolUseId.isEmpty()) {
            events.append(ActivityEvent::operationCompleted(toolUseId));
        }
    }

    if (!hasToolResult) {
        return {ActivityEvent::newPrompt()};
    }
    return events.isEmpty() ? QList<ActivityEvent>{ActivityEvent::ignored()} : events;
}

QString TranscriptParser::formatOperationLabel(const QString &toolName, const QJsonObject &input)
{
    auto baseName = [&input](const QString &key) {
        return input.value(key).toString().section(QLatin1Char('/'), -1);
    };

    if (toolName == QStringLiteral("Read")) {
        return QStringLiteral("Reading %1").arg(baseName(QStringLiteral("file_path")));
    } else if (toolName == QStringLiteral("Edit")) {
        return QStringLiteral("Editing %1").arg(baseName(QStringLiteral("file_path")));
    } else if (toolName == QStringLiteral("Write")) {
        return QStringLiteral("Writing %1").arg(baseName(QStringLiteral("file_path")));
    } else if (toolName == QStringLiteral("Bash")) {
        QString command = input.value(QStringLiteral("command")).toString();
        if (command.length() > MaxCommandLabelLength) {
            command = command.left(MaxCommandLabelLength) + QChar(0x2026);
        }
        return QStringLiteral("Running: %1").arg(command);
    } else if (toolName == QStringLiteral("Glob")) {
        return QStringLiteral("Searching files");
    } else if (toolName == QStringLiteral("Grep")) {
        return QStringLiteral("Searching code");
    } else if (toolName == QStringLiteral("WebFetch")) {
        return QStringLiteral("Fetching web content");
    } else if (toolName == QStringLiteral("WebSearch")) {
        return QStringLiteral("Searching the web");
    } else if (toolName == QStringLiteral("Task")) {
        return QStringLiteral("Running subtask");
    } else if (toolName == QStringLiteral("AskUserQuestion")) {
        return QStringLiteral("Waiting for your answer");
    } else if (toolName == QStringLiteral("EnterPlanMode")) {
        return QStringLiteral("Planning");
    } else if (toolName == QStringLiteral("NotebookEdit")) {
        return QStringLiteral("Editing notebook");
    }
    return QStringLiteral("Using %1").arg(toolName);
}

} // namespace PixelAgents
