// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "MyersAligner.h"

#include "Logging.h"
#include "TextLines.h"

EditOpList MyersAligner::align(const TextLines& left, const TextLines& right) const
{
    DiffList diffList;

    calcDiff(left.getLineData(), right.getLineData(), diffList);
    diffList.verify(left.size(), right.size());

    return diffList.toEditOps();
}

void MyersAligner::calcDiff(const LineDataVector& v1, const LineDataVector& v2, DiffList& diffList) const
{
    diffList.clear();

    const LineCount size1 = static_cast<LineCount>(v1.size());
    const LineCount size2 = static_cast<LineCount>(v2.size());

    std::vector<e_Step> steps;
    steps.reserve(static_cast<size_t>(size1) + static_cast<size_t>(size2));
    compareSeq(v1, 0, size1, v2, 0, size2, steps);

    // Fold the steps into runs of equal lines each followed by one block of differences.
    Diff d(0, 0, 0);
    for(const e_Step step: steps)
    {
        if(step == e_Step::Equal)
        {
            if(d.diff1() > 0 || d.diff2() > 0)
            {
                diffList.push_back(d);
                d = Diff(0, 0, 0);
            }
            d.adjustNumberOfEquals(1);
        }
        else if(step == e_Step::Delete)
            d.adjustDiff1(1);
        else
            d.adjustDiff2(1);
    }

    if(!d.isEmpty())
        diffList.push_back(d);

    qCDebug(ddmergeCore) << "Myers diff:" << size1 << "vs" << size2 << "lines," << diffList.size() << "runs.";
}

/*
    Emits the steps for v1[begin1, end1) against v2[begin2, end2). Common head and tail lines are
    matched directly, the rest is split at the middle snake and both halves are compared on their own.
*/
void MyersAligner::compareSeq(const LineDataVector& v1, LineType begin1, LineType end1,
                              const LineDataVector& v2, LineType begin2, LineType end2,
                              std::vector<e_Step>& steps)
{
    while(begin1 < end1 && begin2 < end2 && LineData::equal(v1[begin1], v2[begin2]))
    {
        steps.push_back(e_Step::Equal);
        ++begin1;
        ++begin2;
    }

    LineCount suffix = 0;
    while(begin1 < end1 && begin2 < end2 && LineData::equal(v1[end1 - 1], v2[end2 - 1]))
    {
        --end1;
        --end2;
        ++suffix;
    }

    LineType split1 = 0, split2 = 0;
    if(begin1 == end1)
        steps.insert(steps.end(), end2 - begin2, e_Step::Insert);
    else if(begin2 == end2)
        steps.insert(steps.end(), end1 - begin1, e_Step::Delete);
    else if(diag(v1, begin1, end1, v2, begin2, end2, split1, split2))
    {
        compareSeq(v1, begin1, split1, v2, begin2, split2, steps);
        compareSeq(v1, split1, end1, v2, split2, end2, steps);
    }
    else
    {
        // Nothing in common at all.
        steps.insert(steps.end(), end1 - begin1, e_Step::Delete);
        steps.insert(steps.end(), end2 - begin2, e_Step::Insert);
    }

    steps.insert(steps.end(), suffix, e_Step::Equal);
}

/*
    Runs the forward and the reverse search at the same time until their furthest reaching paths
    overlap on one diagonal. The end of the forward snake there lies on a shortest edit script and is
    returned in split1/split2. Both ranges must be non-empty and must not start or end with equal lines.
    Returns false when the only script is to delete everything and insert everything.
*/
bool MyersAligner::diag(const LineDataVector& v1, LineType begin1, LineType end1,
                        const LineDataVector& v2, LineType begin2, LineType end2,
                        LineType& split1, LineType& split2)
{
    const qint32 size1 = end1 - begin1;
    const qint32 size2 = end2 - begin2;
    const qint32 maxD = (size1 + size2 + 1) / 2;
    const qint32 offset = maxD;
    const qint32 length = 2 * maxD + 2;
    const qint32 delta = size1 - size2;
    //With an odd delta the paths meet during a forward step, otherwise during a reverse step.
    const bool bFront = (delta % 2 != 0);

    //Furthest x reached on each diagonal, counted from the start for fd and from the end for bd.
    std::vector<qint32> fd(length, -1);
    std::vector<qint32> bd(length, -1);
    fd[offset + 1] = 0;
    bd[offset + 1] = 0;

    //Diagonals that already left the edit graph are not extended any further.
    qint32 fStart = 0, fEnd = 0, bStart = 0, bEnd = 0;

    for(qint32 d = 0; d < maxD; ++d)
    {
        for(qint32 k = -d + fStart; k <= d - fEnd; k += 2)
        {
            const qint32 kOffset = offset + k;
            qint32 x;
            if(k == -d || (k != d && fd[kOffset - 1] < fd[kOffset + 1]))
                x = fd[kOffset + 1];
            else
                x = fd[kOffset - 1] + 1;

            qint32 y = x - k;
            while(x < size1 && y < size2 && LineData::equal(v1[begin1 + x], v2[begin2 + y]))
            {
                ++x;
                ++y;
            }
            fd[kOffset] = x;

            if(x > size1)
                fEnd += 2;
            else if(y > size2)
                fStart += 2;
            else if(bFront)
            {
                const qint32 bOffset = offset + delta - k;
                if(bOffset >= 0 && bOffset < length && bd[bOffset] != -1 && x >= size1 - bd[bOffset])
                {
                    split1 = begin1 + x;
                    split2 = begin2 + y;
                    return true;
                }
            }
        }

        for(qint32 k = -d + bStart; k <= d - bEnd; k += 2)
        {
            const qint32 kOffset = offset + k;
            qint32 x;
            if(k == -d || (k != d && bd[kOffset - 1] < bd[kOffset + 1]))
                x = bd[kOffset + 1];
            else
                x = bd[kOffset - 1] + 1;

            qint32 y = x - k;
            while(x < size1 && y < size2 && LineData::equal(v1[end1 - 1 - x], v2[end2 - 1 - y]))
            {
                ++x;
                ++y;
            }
            bd[kOffset] = x;

            if(x > size1)
                bEnd += 2;
            else if(y > size2)
                bStart += 2;
            else if(!bFront)
            {
                const qint32 fOffset = offset + delta - k;
                if(fOffset >= 0 && fOffset < length && fd[fOffset] != -1)
                {
                    const qint32 forwardX = fd[fOffset];
                    if(forwardX >= size1 - x)
                    {
                        split1 = begin1 + forwardX;
                        split2 = begin2 + forwardX - (fOffset - offset);
                        return true;
                    }
                }
            }
        }
    }

    return false;
}
