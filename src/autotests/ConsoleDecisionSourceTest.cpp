/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include <QTest>
#include <QTextStream>
#include <QtGlobal>

#include "../ConsoleDecisionSource.h"

class ConsoleDecisionSourceTest: public QObject
{
    Q_OBJECT;

  private:
    static HunkDecision askHunk(QString input, QString* pOutput = nullptr)
    {
        QString output;
        QTextStream in(&input, QIODevice::ReadOnly);
        QTextStream out(&output, QIODevice::WriteOnly);

        ConsoleDecisionSource source(in, out);
        const HunkDecision decision = source.hunkDecision(Hunk(0, 1, 0, 1, {"old\n"}, {"new\n"}, {}, {}), 0, 1, "f.txt");
        out.flush();
        if(pOutput != nullptr)
            *pOutput = output;
        return decision;
    }

    static EntryDecision askEntry(const DiffEntry& entry, QString input)
    {
        QString output;
        QTextStream in(&input, QIODevice::ReadOnly);
        QTextStream out(&output, QIODevice::WriteOnly);

        ConsoleDecisionSource source(in, out);
        return source.entryDecision(entry);
    }

  private Q_SLOTS:
    void testHunkAnswers_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<qint32>("kind");
        QTest::addColumn<qint32>("choice");

        const qint32 choice = (qint32)HunkDecision::e_Kind::Choice;
        QTest::newRow("left") << "l\n" << choice << (qint32)e_HunkChoice::Left;
        QTest::newRow("right upper case") << "R\n" << choice << (qint32)e_HunkChoice::Right;
        QTest::newRow("skip with spaces") << "  s  \n" << choice << (qint32)e_HunkChoice::Skip;
        QTest::newRow("skip file") << "f\n" << (qint32)HunkDecision::e_Kind::SkipFile << (qint32)e_HunkChoice::Skip;
        QTest::newRow("quit") << "q\n" << (qint32)HunkDecision::e_Kind::Quit << (qint32)e_HunkChoice::Skip;
        QTest::newRow("end of input") << "" << (qint32)HunkDecision::e_Kind::Quit << (qint32)e_HunkChoice::Skip;
        QTest::newRow("retry after invalid") << "x\nleft\n\nr\n" << choice << (qint32)e_HunkChoice::Right;
        QTest::newRow("no trailing newline") << "l" << choice << (qint32)e_HunkChoice::Left;
    }

    void testHunkAnswers()
    {
        QFETCH(QString, input);
        QFETCH(qint32, kind);
        QFETCH(qint32, choice);

        const HunkDecision decision = askHunk(input);
        QCOMPARE((qint32)decision.kind(), kind);
        QCOMPARE((qint32)decision.getChoice(), choice);
    }

    void testHunkIsShown()
    {
        QString output;
        (void)askHunk("x\ns\n", &output);

        QVERIFY(output.contains("[1/1] Hunk in f.txt"));
        QVERIFY(output.contains("  -old"));
        QVERIFY(output.contains("  +new"));
        QCOMPARE(output.count("Invalid choice, please try again."), 1);
    }

    void testEntryAnswers_data()
    {
        QTest::addColumn<qint32>("kind");
        QTest::addColumn<QString>("input");
        QTest::addColumn<bool>("bQuit");
        QTest::addColumn<qint32>("action");

        const qint32 leftOnly = (qint32)e_DiffKind::LeftOnly;
        const qint32 rightOnly = (qint32)e_DiffKind::RightOnly;
        const qint32 mismatch = (qint32)e_DiffKind::TypeMismatch;

        QTest::newRow("copy") << leftOnly << "c\n" << false << (qint32)e_EntryAction::Copy;
        QTest::newRow("delete") << rightOnly << "d\n" << false << (qint32)e_EntryAction::Delete;
        QTest::newRow("skip") << leftOnly << "s\n" << false << (qint32)e_EntryAction::Skip;
        QTest::newRow("quit") << rightOnly << "q\n" << true << (qint32)e_EntryAction::Skip;
        QTest::newRow("eof") << leftOnly << "" << true << (qint32)e_EntryAction::Skip;
        QTest::newRow("left is not valid here") << leftOnly << "l\nc\n" << false << (qint32)e_EntryAction::Copy;
        QTest::newRow("use left") << mismatch << "l\n" << false << (qint32)e_EntryAction::UseLeft;
        QTest::newRow("use right") << mismatch << "r\n" << false << (qint32)e_EntryAction::UseRight;
        QTest::newRow("copy is not valid here") << mismatch << "c\ns\n" << false << (qint32)e_EntryAction::Skip;
        QTest::newRow("mismatch quit") << mismatch << "q\n" << true << (qint32)e_EntryAction::Skip;
    }

    void testEntryAnswers()
    {
        QFETCH(qint32, kind);
        QFETCH(QString, input);
        QFETCH(bool, bQuit);
        QFETCH(qint32, action);

        DiffEntry entry;
        switch((e_DiffKind)kind)
        {
            case e_DiffKind::LeftOnly:
                entry = DiffEntry::leftOnly("x", false);
                break;
            case e_DiffKind::RightOnly:
                entry = DiffEntry::rightOnly("x", true);
                break;
            default:
                entry = DiffEntry::typeMismatch("x", true);
        }

        const EntryDecision decision = askEntry(entry, input);
        QCOMPARE(decision.isQuit(), bQuit);
        QCOMPARE((qint32)decision.getAction(), action);
    }
};

QTEST_MAIN(ConsoleDecisionSourceTest);

#include "ConsoleDecisionSourceTest.moc"
