// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "diff.h"

#include "Logging.h"

#include <QDebugStateSaver>

bool LineData::equal(const LineData& l1, const LineData& l2)
{
    if(l1.getBuffer() == nullptr || l2.getBuffer() == nullptr) return false;

    return l1.size() == l2.size() && l1.getLine() == l2.getLine();
}

void DiffList::verify(const LineCount size1, const LineCount size2) const
{
#ifndef NDEBUG
    SafeInt<qint64> l1 = 0;
    SafeInt<qint64> l2 = 0;

    for(const Diff& curDiff: *this)
    {
        Q_ASSERT(curDiff.numberOfEquals() >= 0);
        l1 += curDiff.numberOfEquals() + curDiff.diff1();
        l2 += curDiff.numberOfEquals() + curDiff.diff2();
    }

    Q_ASSERT(l1 == size1 && l2 == size2);
#else
    Q_UNUSED(size1); Q_UNUSED(size2);
#endif
}

EditOpList DiffList::toEditOps() const
{
    EditOpList ops;
    SafeInt<LineType> l1 = 0;
    SafeInt<LineType> l2 = 0;

    for(const Diff& curDiff: *this)
    {
        const LineCount eq = curDiff.numberOfEquals();
        const SafeInt<LineCount> d1 = curDiff.diff1();
        const SafeInt<LineCount> d2 = curDiff.diff2();

        if(eq > 0)
        {
            ops.emplace_back(e_EditOpType::Equal, l1, eq, l2, eq);
            l1 += eq;
            l2 += eq;
        }

        if(d1 > 0 && d2 > 0)
            ops.emplace_back(e_EditOpType::Replace, l1, d1, l2, d2);
        else if(d1 > 0)
            ops.emplace_back(e_EditOpType::Delete, l1, d1, l2, 0);
        else if(d2 > 0)
            ops.emplace_back(e_EditOpType::Insert, l1, 0, l2, d2);

        l1 += d1;
        l2 += d2;
    }

    qCDebug(ddmergeCore) << "Converted" << size() << "diff runs into" << ops.size() << "edit operations.";
    return ops;
}

QDebug operator<<(QDebug debug, const EditOp& op)
{
    QDebugStateSaver saver(debug);
    static const char* const names[] = {"Equal", "Delete", "Insert", "Replace"};

    debug.nospace() << names[(qint32)op.type()] << "(-" << op.leftStart() << ',' << op.leftCount()
                    << " +" << op.rightStart() << ',' << op.rightCount() << ')';
    return debug;
}
