// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef LINEALIGNER_H
#define LINEALIGNER_H

#include "diff.h"

class TextLines;

/*
    Computes the line alignment of two texts. The returned operations are ordered, contiguous and
    cover both line ranges completely. Implementations must be deterministic.
*/
class LineAligner
{
  public:
    virtual ~LineAligner() = default;

    [[nodiscard]] virtual EditOpList align(const TextLines& left, const TextLines& right) const = 0;
};

#endif
