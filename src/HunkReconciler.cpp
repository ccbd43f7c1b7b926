// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "HunkReconciler.h"

#include "Logging.h"
#include "TextLines.h"

ReconciledTexts HunkReconciler::reconcile(const QString& leftText, const QString& rightText, const HunkChoiceList& choices) const
{
    const TextLines left = TextLines::fromText(leftText);
    const TextLines right = TextLines::fromText(rightText);

    QStringList leftBuffer, rightBuffer;
    size_t changeIndex = 0;

    const EditOpList ops = m_pAligner->align(left, right);
    for(const EditOp& op: ops)
    {
        if(!op.isChange())
        {
            appendLines(left, op.leftStart(), op.leftCount(), leftBuffer);
            appendLines(left, op.leftStart(), op.leftCount(), rightBuffer);
            continue;
        }

        // A missing decision never discards anything.
        const e_HunkChoice choice = changeIndex < choices.size() ? choices[changeIndex] : e_HunkChoice::Skip;
        ++changeIndex;

        switch(choice)
        {
            case e_HunkChoice::Left:
                appendLines(left, op.leftStart(), op.leftCount(), leftBuffer);
                appendLines(left, op.leftStart(), op.leftCount(), rightBuffer);
                break;
            case e_HunkChoice::Right:
                appendLines(right, op.rightStart(), op.rightCount(), leftBuffer);
                appendLines(right, op.rightStart(), op.rightCount(), rightBuffer);
                break;
            case e_HunkChoice::Skip:
                appendLines(left, op.leftStart(), op.leftCount(), leftBuffer);
                appendLines(right, op.rightStart(), op.rightCount(), rightBuffer);
                break;
        }
    }

    if(changeIndex < choices.size())
        qCDebug(ddmergeCore) << "Ignoring" << choices.size() - changeIndex << "surplus choices.";

    bool bNewLeftEOL = false, bNewRightEOL = false;
    resolveTrailingNewlines(choices, left.hasTrailingNewline(), right.hasTrailingNewline(), bNewLeftEOL, bNewRightEOL);

    ReconciledTexts result;
    result.left = TextLines::join(leftBuffer, bNewLeftEOL);
    result.right = TextLines::join(rightBuffer, bNewRightEOL);
    return result;
}

void HunkReconciler::resolveTrailingNewlines(const HunkChoiceList& choices, bool bLeftHasEOL, bool bRightHasEOL,
                                             bool& bNewLeftEOL, bool& bNewRightEOL)
{
    bNewLeftEOL = bLeftHasEOL;
    bNewRightEOL = bRightHasEOL;

    for(HunkChoiceList::const_reverse_iterator it = choices.crbegin(); it != choices.crend(); ++it)
    {
        if(*it == e_HunkChoice::Left)
        {
            bNewRightEOL = bLeftHasEOL;
            return;
        }
        if(*it == e_HunkChoice::Right)
        {
            bNewLeftEOL = bRightHasEOL;
            return;
        }
    }
}

void HunkReconciler::appendLines(const TextLines& source, LineType first, LineCount count, QStringList& buffer)
{
    const SafeInt<qint64> end = SafeInt<qint64>(first) + count;
    if(first < 0 || count < 0 || end > source.size())
    {
        qCWarning(ddmergeCore) << "Skipping out of range lines" << first << "+" << count << "of" << source.size();
        return;
    }

    buffer.append(source.lines(first, count));
}
