// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef HUNK_H
#define HUNK_H

#include "TypeUtils.h"

#include <vector>

#include <QStringList>

enum class e_HunkChoice
{
    Left,
    Right,
    Skip
};

using HunkChoiceList = std::vector<e_HunkChoice>;

/*
    One block of changed lines. All line lists hold rendered lines, that is each line still
    carries its '\n' unless it is the unterminated last line of its text.
    Context lines are always taken from the left text.
*/
class Hunk
{
  public:
    Hunk() = default;
    Hunk(LineType leftStart, LineCount leftCount, LineType rightStart, LineCount rightCount,
         const QStringList& leftLines, const QStringList& rightLines,
         const QStringList& contextBefore, const QStringList& contextAfter):
        mLeftStart(leftStart),
        mLeftCount(leftCount),
        mRightStart(rightStart),
        mRightCount(rightCount),
        mLeftLines(leftLines),
        mRightLines(rightLines),
        mContextBefore(contextBefore),
        mContextAfter(contextAfter)
    {
    }

    [[nodiscard]] LineType leftStart() const { return mLeftStart; }
    [[nodiscard]] LineCount leftCount() const { return mLeftCount; }
    [[nodiscard]] LineType rightStart() const { return mRightStart; }
    [[nodiscard]] LineCount rightCount() const { return mRightCount; }

    [[nodiscard]] const QStringList& leftLines() const { return mLeftLines; }
    [[nodiscard]] const QStringList& rightLines() const { return mRightLines; }
    [[nodiscard]] const QStringList& contextBefore() const { return mContextBefore; }
    [[nodiscard]] const QStringList& contextAfter() const { return mContextAfter; }

  private:
    LineType mLeftStart = 0;
    LineCount mLeftCount = 0;
    LineType mRightStart = 0;
    LineCount mRightCount = 0;

    QStringList mLeftLines;
    QStringList mRightLines;
    QStringList mContextBefore;
    QStringList mContextAfter;
};

using HunkList = std::vector<Hunk>;

#endif
