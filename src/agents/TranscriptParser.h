/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTPARSER_H
#define TRANSCRIPTPARSER_H

#include "pixelagents_export.h"

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

namespace PixelAgents
{

/**
 * A normalized event extracted from one transcript line
 */
struct PIXELAGENTS_EXPORT ActivityEvent {
    enum class Kind {
        OperationStarted, // assistant invoked a tool
        OperationCompleted, // tool result came back
        TurnEnded, // assistant finished speaking (soft when debounced)
        NewPrompt, // user sent a new prompt
        Ignored,
    };

    Kind kind = Kind::Ignored;
    QString operationId;
    QString label; // OperationStarted only
    bool debounced = false; // TurnEnded only

    static ActivityEvent operationStarted(const QString &id, const QString &label);
    static ActivityEvent operationCompleted(const QString &id);
    static ActivityEvent turnEnded(bool debounced);
    static ActivityEvent newPrompt();
    static ActivityEvent ignored();

    bool operator==(const ActivityEvent &other) const
    {
        return kind == other.kind && operationId == other.operationId && label == other.label && debounced == other.debounced;
    }
};

/**
 * TranscriptParser turns assistant transcript JSONL lines into ActivityEvents.
 *
 * Stateless; every call is independent. Lines that are not JSON objects, or
 * records we don't care about, produce a single Ignored event.
 */
class PIXELAGENTS_EXPORT TranscriptParser
{
public:
    static QList<ActivityEvent> parseLine(const QByteArray &line);

    /**
     * Short human readable label for a tool invocation,
     * e.g. "Reading main.cpp" or "Running: make -j8"
     */
    static QString formatOperationLabel(const QString &toolName, const QJsonObject &input);

    static constexpr int MaxCommandLabelLength = 30;

private:
    static QList<ActivityEvent> parseAssistantRecord(const QJsonObject &record);
    static QList<ActivityEvent> parseUserRecord(const QJsonObject &record);
};

} // namespace PixelAgents

Q_DECLARE_METATYPE(PixelAgents::ActivityEvent)

#endif // TRANSCRIPTPARSER_H
