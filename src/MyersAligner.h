// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef MYERSALIGNER_H
#define MYERSALIGNER_H

#include "LineAligner.h"
#include "diff.h"

#include <vector>

/*
    Myers O(ND) shortest edit script over whole lines, linear space variant splitting at the
    middle snake. Lines compare equal only if their terminators match as well.
*/
class MyersAligner: public LineAligner
{
  public:
    [[nodiscard]] EditOpList align(const TextLines& left, const TextLines& right) const override;

    void calcDiff(const LineDataVector& v1, const LineDataVector& v2, DiffList& diffList) const;

  private:
    enum class e_Step : char
    {
        Equal,
        Delete,
        Insert
    };

    static void compareSeq(const LineDataVector& v1, LineType begin1, LineType end1,
                           const LineDataVector& v2, LineType begin2, LineType end2,
                           std::vector<e_Step>& steps);
    static bool diag(const LineDataVector& v1, LineType begin1, LineType end1,
                     const LineDataVector& v2, LineType begin2, LineType end2,
                     LineType& split1, LineType& split2);
};

#endif
