/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "TranscriptParserTest.h"

// Qt
#include <QJsonObject>
#include <QTest>

// PixelAgents
#include "../agents/TranscriptParser.h"

using namespace PixelAgents;

namespace
{
using Kind = ActivityEvent::Kind;

QList<ActivityEvent> parse(const char *line)
{
    return TranscriptParser::parseLine(QByteArray(line));
}

bool isIgnored(const QList<ActivityEvent> &events)
{
    return events.size() == 1 && events.first().kind == Kind::Ignored;
}
}

void TranscriptParserTest::testBlankLine()
{
    QVERIFY(isIgnored(parse("")));
    QVERIFY(isIgnored(parse("   \t  ")));
}

void TranscriptParserTest::testInvalidJson()
{
    QVERIFY(isIgnored(parse("{\"type\":\"assistant\",")));
    QVERIFY(isIgnored(parse("not json at all")));
}

void TranscriptParserTest::testNonObjectJson()
{
    QVERIFY(isIgnored(parse("[1,2,3]")));
    QVERIFY(isIgnored(parse("42")));
}

void TranscriptParserTest::testUnknownRecordType()
{
    QVERIFY(isIgnored(parse(R"({"type":"summary","summary":"Refactor"})")));
    QVERIFY(isIgnored(parse(R"({"message":{"content":"no type"}})")));
}

void TranscriptParserTest::testToolUseStartsOperation()
{
    const auto events = parse(
        R"({"type":"assistant","message":{"content":[{"type":"tool_use","id":"toolu_1","name":"Read","input":{"file_path":"/src/main.cpp"}}]}})");

    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0].kind, Kind::OperationStarted);
    QCOMPARE(events[0].operationId, QStringLiteral("toolu_1"));
    QCOMPARE(events[0].label, QStringLiteral("Reading main.cpp"));
}

void TranscriptParserTest::testMultipleToolUses()
{
    const auto events = parse(R"({"type":"assistant","message":{"content":[)"
                              R"({"type":"tool_use","id":"a","name":"Glob","input":{}},)"
                              R"({"type":"tool_use","id":"b","name":"Grep","input":{}}]}})");

    QCOMPARE(events.size(), 2);
    QCOMPARE(events[0], ActivityEvent::operationStarted(QStringLiteral("a"), QStringLiteral("Searching files")));
    QCOMPARE(events[1], ActivityEvent::operationStarted(QStringLiteral("b"), QStringLiteral("Searching code")));
}

void TranscriptParserTest::testToolUseWinsOverText()
{
    const auto events = parse(R"({"type":"assistant","message":{"content":[)"
                              R"({"type":"text","text":"Let me check."},)"
                              R"({"type":"tool_use","id":"t1","name":"Bash","input":{"command":"ls"}}]}})");

    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0].kind, Kind::OperationStarted);
    QCOMPARE(events[0].label, QStringLiteral("Running: ls"));
}

void TranscriptParserTest::testTextOnlyIsDebouncedTurnEnd()
{
    const auto events = parse(R"({"type":"assistant","message":{"content":[{"type":"text","text":"Done."}]}})");

    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0].kind, Kind::TurnEnded);
    QVERIFY(events[0].debounced);
}

void TranscriptParserTest::testThinkingOnlyIgnored()
{
    QVERIFY(isIgnored(parse(R"({"type":"assistant","message":{"content":[{"type":"thinking","thinking":"hmm"}]}})")));
    QVERIFY(isIgnored(parse(R"({"type":"assistant","message":{"content":[]}})")));
}

void TranscriptParserTest::testToolUseWithoutIdIgnored()
{
    // Without an id the completion could never be matched
    QVERIFY(isIgnored(parse(R"({"type":"assistant","message":{"content":[{"type":"tool_use","name":"Read","input":{}}]}})")));
}

void TranscriptParserTest::testStringPromptIsNewPrompt()
{
    const auto events = parse(R"({"type":"user","message":{"content":"Fix the build"}})");
    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0].kind, Kind::NewPrompt);
}

void TranscriptParserTest::testWhitespacePromptIgnored()
{
    QVERIFY(isIgnored(parse(R"({"type":"user","message":{"content":"   "}})")));
}

void TranscriptParserTest::testArrayPromptIsNewPrompt()
{
    const auto events = parse(R"({"type":"user","message":{"content":[{"type":"text","text":"And the tests"}]}})");
    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0].kind, Kind::NewPrompt);
}

void TranscriptParserTest::testToolResultCompletesOperation()
{
    const auto events = parse(R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"toolu_1","content":"ok"}]}})");

    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0], ActivityEvent::operationCompleted(QStringLiteral("toolu_1")));
}

void TranscriptParserTest::testMultipleToolResults()
{
    const auto events = parse(R"({"type":"user","message":{"content":[)"
                              R"({"type":"tool_result","tool_use_id":"a"},)"
                              R"({"type":"text","text":"interleaved"},)"
                              R"({"type":"tool_result","tool_use_id":"b"}]}})");

    // A text block next to results does not make it a new prompt
    QCOMPARE(events.size(), 2);
    QCOMPARE(events[0].operationId, QStringLiteral("a"));
    QCOMPARE(events[1].operationId, QStringLiteral("b"));
    QCOMPARE(events[1].kind, Kind::OperationCompleted);
}

void TranscriptParserTest::testTurnDurationIsAuthoritative()
{
    const auto events = parse(R"({"type":"system","subtype":"turn_duration","durationMs":5321})");

    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0].kind, Kind::TurnEnded);
    QVERIFY(!events[0].debounced);
}

void TranscriptParserTest::testOtherSystemSubtypeIgnored()
{
    QVERIFY(isIgnored(parse(R"({"type":"system","subtype":"compact_boundary"})")));
}

void TranscriptParserTest::testFileOperationLabels()
{
    const QJsonObject input{{QStringLiteral("file_path"), QStringLiteral("/home/u/app/src/widget.h")}};

    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("Read"), input), QStringLiteral("Reading widget.h"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("Edit"), input), QStringLiteral("Editing widget.h"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("Write"), input), QStringLiteral("Writing widget.h"));
}

void TranscriptParserTest::testBashLabelTruncation()
{
    const QJsonObject shortInput{{QStringLiteral("command"), QStringLiteral("make -j8")}};
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("Bash"), shortInput), QStringLiteral("Running: make -j8"));

    const QString longCommand = QStringLiteral("cmake --build build --target all --parallel 16");
    const QJsonObject longInput{{QStringLiteral("command"), longCommand}};
    const QString label = TranscriptParser::formatOperationLabel(QStringLiteral("Bash"), longInput);

    QCOMPARE(label, QStringLiteral("Running: ") + longCommand.left(30) + QChar(0x2026));
}

void TranscriptParserTest::testFixedLabels()
{
    const QJsonObject input;
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("WebFetch"), input), QStringLiteral("Fetching web content"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("WebSearch"), input), QStringLiteral("Searching the web"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("Task"), input), QStringLiteral("Running subtask"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("AskUserQuestion"), input), QStringLiteral("Waiting for your answer"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("EnterPlanMode"), input), QStringLiteral("Planning"));
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("NotebookEdit"), input), QStringLiteral("Editing notebook"));
}

void TranscriptParserTest::testUnknownToolLabel()
{
    QCOMPARE(TranscriptParser::formatOperationLabel(QStringLiteral("TodoWrite"), QJsonObject()), QStringLiteral("Using TodoWrite"));
}

QTEST_GUILESS_MAIN(TranscriptParserTest)

#include "moc_TranscriptParserTest.cpp"
