/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include <QTest>
#include <QtGlobal>

#include "../MyersAligner.h"
#include "../TextLines.h"

class MyersAlignerTest: public QObject
{
    Q_OBJECT;

  private:
    static EditOpList align(const QString& left, const QString& right)
    {
        return MyersAligner().align(TextLines::fromText(left), TextLines::fromText(right));
    }

    // Every op continues exactly where the previous one ended and equal ops really match.
    static bool isConsistent(const EditOpList& ops, const TextLines& left, const TextLines& right)
    {
        LineType l = 0, r = 0;
        for(const EditOp& op: ops)
        {
            if(op.leftStart() != l || op.rightStart() != r)
                return false;

            if(op.type() == e_EditOpType::Equal)
            {
                if(op.leftCount() != op.rightCount())
                    return false;
                for(LineCount i = 0; i < op.leftCount(); ++i)
                {
                    if(left.renderedLine(l + i) != right.renderedLine(r + i))
                        return false;
                }
            }

            l += op.leftCount();
            r += op.rightCount();
        }
        return l == left.size() && r == right.size();
    }

    static LineCount changedLines(const EditOpList& ops)
    {
        LineCount count = 0;
        for(const EditOp& op: ops)
        {
            if(op.isChange())
                count += op.leftCount() + op.rightCount();
        }
        return count;
    }

    static QString linesOf(const QString& letters)
    {
        QString result;
        for(const QChar c: letters)
        {
            result += c;
            result += '\n';
        }
        return result;
    }

  private Q_SLOTS:
    void testEmpty()
    {
        QVERIFY(align("", "").empty());
    }

    void testIdentical()
    {
        const EditOpList expected = {EditOp(e_EditOpType::Equal, 0, 2, 0, 2)};
        QVERIFY(align("a\nb\n", "a\nb\n") == expected);
    }

    void testOneSidedEmpty()
    {
        const EditOpList inserted = {EditOp(e_EditOpType::Insert, 0, 0, 0, 2)};
        QVERIFY(align("", "a\nb\n") == inserted);

        const EditOpList deleted = {EditOp(e_EditOpType::Delete, 0, 2, 0, 0)};
        QVERIFY(align("a\nb\n", "") == deleted);
    }

    void testReplace()
    {
        const EditOpList expected = {
            EditOp(e_EditOpType::Equal, 0, 1, 0, 1),
            EditOp(e_EditOpType::Replace, 1, 1, 1, 1),
            EditOp(e_EditOpType::Equal, 2, 1, 2, 1),
        };
        QVERIFY(align("line1\nline2\nline3\n", "line1\nmodified\nline3\n") == expected);
    }

    void testDeleteAndInsert()
    {
        const EditOpList deleted = {
            EditOp(e_EditOpType::Equal, 0, 1, 0, 1),
            EditOp(e_EditOpType::Delete, 1, 1, 1, 0),
            EditOp(e_EditOpType::Equal, 2, 1, 1, 1),
        };
        QVERIFY(align("a\nb\nc\n", "a\nc\n") == deleted);

        const EditOpList inserted = {
            EditOp(e_EditOpType::Equal, 0, 1, 0, 1),
            EditOp(e_EditOpType::Insert, 1, 0, 1, 1),
            EditOp(e_EditOpType::Equal, 1, 1, 2, 1),
        };
        QVERIFY(align("a\nc\n", "a\nb\nc\n") == inserted);
    }

    void testTerminatorIsCompared()
    {
        const EditOpList expected = {EditOp(e_EditOpType::Replace, 0, 1, 0, 1)};
        QVERIFY(align("hello", "hello\n") == expected);

        const EditOpList crlf = {EditOp(e_EditOpType::Replace, 0, 1, 0, 1), EditOp(e_EditOpType::Equal, 1, 1, 1, 1)};
        QVERIFY(align("a\r\nb\n", "a\nb\n") == crlf);
    }

    void testShortestScript_data()
    {
        QTest::addColumn<QString>("left");
        QTest::addColumn<QString>("right");
        QTest::addColumn<LineCount>("distance");

        QTest::newRow("classic") << QString("abcabba") << QString("cbabac") << 5;
        QTest::newRow("disjoint") << QString("abc") << QString("xyz") << 6;
        QTest::newRow("prefix and suffix") << QString("abXYcd") << QString("abZcd") << 3;
        QTest::newRow("moved block") << QString("abcdef") << QString("defabc") << 6;
        QTest::newRow("repeated lines") << QString("aaaa") << QString("aa") << 2;
        QTest::newRow("interleaved") << QString("axbxcx") << QString("abc") << 3;
    }

    void testShortestScript()
    {
        QFETCH(QString, left);
        QFETCH(QString, right);
        QFETCH(LineCount, distance);

        const TextLines leftLines = TextLines::fromText(linesOf(left));
        const TextLines rightLines = TextLines::fromText(linesOf(right));
        const EditOpList ops = MyersAligner().align(leftLines, rightLines);

        QVERIFY(isConsistent(ops, leftLines, rightLines));
        QCOMPARE(changedLines(ops), distance);

        //No two neighbouring ops share a type, changes are folded into one op per block.
        for(size_t i = 1; i < ops.size(); ++i)
            QVERIFY(ops[i - 1].isChange() != ops[i].isChange());

        //Reproducible.
        QVERIFY(MyersAligner().align(leftLines, rightLines) == ops);
    }

    void testLargeInputs_data()
    {
        QTest::addColumn<bool>("bDisjoint");

        QTest::newRow("nothing in common") << true;
        QTest::newRow("every tenth line changed") << false;
    }

    //The search only keeps two diagonal vectors, so big rewrites stay cheap.
    void testLargeInputs()
    {
        QFETCH(bool, bDisjoint);
        constexpr qint32 lineCount = 5000;

        QString left, right;
        for(qint32 i = 0; i < lineCount; ++i)
        {
            left += QString("left %1\n").arg(i);
            if(bDisjoint || i % 10 == 0)
                right += QString("right %1\n").arg(i);
            else
                right += QString("left %1\n").arg(i);
        }

        const TextLines leftLines = TextLines::fromText(left);
        const TextLines rightLines = TextLines::fromText(right);
        const EditOpList ops = MyersAligner().align(leftLines, rightLines);

        QVERIFY(isConsistent(ops, leftLines, rightLines));
        if(bDisjoint)
        {
            const EditOpList expected = {EditOp(e_EditOpType::Replace, 0, lineCount, 0, lineCount)};
            QVERIFY(ops == expected);
        }
        else
        {
            QCOMPARE(changedLines(ops), 2 * (lineCount / 10));
            QCOMPARE(ops.size(), (size_t)(2 * (lineCount / 10)));
        }
    }

    void testDiffList()
    {
        const TextLines left = TextLines::fromText("a\nb\nc\n");
        const TextLines right = TextLines::fromText("a\nx\ny\nc\n");

        DiffList diffList;
        MyersAligner().calcDiff(left.getLineData(), right.getLineData(), diffList);

        const DiffList expected = {Diff(1, 1, 2), Diff(1, 0, 0)};
        QVERIFY(diffList == expected);
    }
};

QTEST_MAIN(MyersAlignerTest);

#include "MyersAlignerTest.moc"
