/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FILETAILERTEST_H
#define FILETAILERTEST_H

#include <QObject>

namespace PixelAgents
{

class FileTailerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Line splitting
    void testLineBufferCompleteLines();
    void testLineBufferCarriesPartialLine();
    void testLineBufferSkipsBlankLines();
    void testLineBufferStripsCarriageReturn();

    // Local tailing
    void testLocalDeliversAppendedLines();
    void testLocalStartOffsetSkipsExistingContent();
    void testLocalPartialLineHeldBack();
    void testLocalRedundantReadIsNoOp();
    void testLocalTruncationKeepsOffset();
    void testLocalMissingFileIsNotFatal();
    void testLocalLastActivityAdvances();
    void testLocalStopSilencesDelivery();

    // Remote tailing
    void testBuildTailCommand();
    void testStreamDeliversLines();
    void testStreamClosedWhenFileMissing();
    void testStopDoesNotEmitClosed();
};

}

#endif // FILETAILERTEST_H
