/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include <QTest>
#include <QtGlobal>

#include "../TextLines.h"

class TextLinesTest: public QObject
{
    Q_OBJECT;
  private Q_SLOTS:
    void testSplit_data()
    {
        QTest::addColumn<QString>("text");
        QTest::addColumn<QStringList>("expectedLines");
        QTest::addColumn<bool>("bTrailingNewline");

        QTest::newRow("empty") << QString() << QStringList() << false;
        QTest::newRow("single unterminated") << QString("a") << QStringList{"a"} << false;
        QTest::newRow("single terminated") << QString("a\n") << QStringList{"a"} << true;
        QTest::newRow("last unterminated") << QString("a\nb") << QStringList{"a", "b"} << false;
        QTest::newRow("only newline") << QString("\n") << QStringList{""} << true;
        QTest::newRow("two newlines") << QString("\n\n") << QStringList{"", ""} << true;
        QTest::newRow("blank middle") << QString("a\n\nb\n") << QStringList{"a", "", "b"} << true;
        QTest::newRow("crlf") << QString("a\r\nb\r\n") << QStringList{"a\r", "b\r"} << true;
        QTest::newRow("lone cr") << QString("a\rb") << QStringList{"a\rb"} << false;
        QTest::newRow("unicode") << QString::fromUtf8("gr\xC3\xBC\xC3\x9F\nzwei") << QStringList{QString::fromUtf8("gr\xC3\xBC\xC3\x9F"), "zwei"} << false;
    }

    void testSplit()
    {
        QFETCH(QString, text);
        QFETCH(QStringList, expectedLines);
        QFETCH(bool, bTrailingNewline);

        const TextLines lines = TextLines::fromText(text);
        QCOMPARE(lines.size(), expectedLines.size());
        QCOMPARE(lines.isEmpty(), expectedLines.isEmpty());
        QCOMPARE(lines.hasTrailingNewline(), bTrailingNewline);
        QCOMPARE(lines.lines(0, lines.size()), expectedLines);
        QCOMPARE(lines.toText(), text);

        //Rendered lines concatenate back to the source.
        QCOMPARE(lines.renderedLines(0, lines.size()).join(QString()), text);
        //So does joining the bare lines under the trailing newline rule.
        QCOMPARE(TextLines::join(lines.lines(0, lines.size()), lines.hasTrailingNewline()), text);
    }

    void testRenderedLines()
    {
        const TextLines lines = TextLines::fromText("one\ntwo\r\nthree");

        QCOMPARE(lines.renderedLine(0), QString("one\n"));
        QCOMPARE(lines.renderedLine(1), QString("two\r\n"));
        QCOMPARE(lines.renderedLine(2), QString("three"));
        QCOMPARE(lines.line(1), QString("two\r"));

        QVERIFY(lines.getLineData()[0].isTerminated());
        QVERIFY(!lines.getLineData()[2].isTerminated());
        QCOMPARE(lines.getLineData()[1].getOffset(), (QtSizeType)4);
    }

    void testOutOfRange()
    {
        const TextLines lines = TextLines::fromText("a\nb\nc\n");

        QVERIFY(lines.line(-1).isNull());
        QVERIFY(lines.line(3).isNull());
        QVERIFY(lines.renderedLine(7).isNull());

        QCOMPARE(lines.renderedLines(1, 10), (QStringList{"b\n", "c\n"}));
        QCOMPARE(lines.lines(-2, 3), QStringList{"a"});
        QVERIFY(lines.lines(5, 2).isEmpty());
        QVERIFY(lines.lines(0, 0).isEmpty());
    }

    void testLinesOutliveSource()
    {
        QString copy;
        {
            const TextLines lines = TextLines::fromText("first\nsecond\n");
            copy = lines.line(1);
        }
        QCOMPARE(copy, QString("second"));
    }

    void testJoin()
    {
        QCOMPARE(TextLines::join(QStringList(), true), QString());
        QCOMPARE(TextLines::join(QStringList(), false), QString());
        QCOMPARE(TextLines::join(QStringList{""}, true), QString("\n"));
        QCOMPARE(TextLines::join(QStringList{"a", "b"}, false), QString("a\nb"));
        QCOMPARE(TextLines::join(QStringList{"a", "b"}, true), QString("a\nb\n"));
    }
};

QTEST_MAIN(TextLinesTest);

#include "TextLinesTest.moc"
