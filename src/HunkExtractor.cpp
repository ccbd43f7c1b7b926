// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "HunkExtractor.h"

#include "Logging.h"
#include "TextLines.h"

#include <algorithm>

HunkList HunkExtractor::extract(const QString& leftText, const QString& rightText, LineCount contextRadius) const
{
    const TextLines left = TextLines::fromText(leftText);
    const TextLines right = TextLines::fromText(rightText);
    const LineCount radius = std::max<LineCount>(contextRadius, 0);

    HunkList hunks;
    const EditOpList ops = m_pAligner->align(left, right);
    for(const EditOp& op: ops)
    {
        if(!op.isChange())
            continue;

        const LineType anchor = op.leftStart();
        // Pure insertions are anchored before the left line at leftStart.
        LineType afterStart = anchor;
        if(op.type() != e_EditOpType::Insert)
            afterStart = SafeInt<LineType>(anchor) + op.leftCount();
        const LineType beforeStart = std::max<LineType>(anchor - radius, 0);

        hunks.emplace_back(op.leftStart(), op.leftCount(), op.rightStart(), op.rightCount(),
                           left.renderedLines(op.leftStart(), op.leftCount()),
                           right.renderedLines(op.rightStart(), op.rightCount()),
                           left.renderedLines(beforeStart, anchor - beforeStart),
                           left.renderedLines(afterStart, radius));

        qCDebug(ddmergeCore) << "Hunk" << hunks.size() << "from" << op;
    }

    return hunks;
}
