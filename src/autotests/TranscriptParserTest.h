/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTPARSERTEST_H
#define TRANSCRIPTPARSERTEST_H

#include <QObject>

namespace PixelAgents
{

class TranscriptParserTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // Malformed input
    void testBlankLine();
    void testInvalidJson();
    void testNonObjectJson();
    void testUnknownRecordType();

    // Assistant records
    void testToolUseStartsOperation();
    void testMultipleToolUses();
    void testToolUseWinsOverText();
    void testTextOnlyIsDebouncedTurnEnd();
    void testThinkingOnlyIgnored();
    void testToolUseWithoutIdIgnored();

    // User records
    void testStringPromptIsNewPrompt();
    void testWhitespacePromptIgnored();
    void testArrayPromptIsNewPrompt();
    void testToolResultCompletesOperation();
    void testMultipleToolResults();

    // System records
    void testTurnDurationIsAuthoritative();
    void testOtherSystemSubtypeIgnored();

    // Labels
    void testFileOperationLabels();
    void testBashLabelTruncation();
    void testFixedLabels();
    void testUnknownToolLabel();
};

}

#endif // TRANSCRIPTPARSERTEST_H
