// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef HUNKEXTRACTOR_H
#define HUNKEXTRACTOR_H

#include "Hunk.h"
#include "LineAligner.h"
#include "MyersAligner.h"

#include <memory>

#include <QString>

class HunkExtractor
{
  public:
    explicit HunkExtractor(const std::shared_ptr<const LineAligner>& pAligner = std::make_shared<MyersAligner>()): m_pAligner(pAligner) {}

    // One hunk per non equal edit operation, in alignment order.
    [[nodiscard]] HunkList extract(const QString& leftText, const QString& rightText, LineCount contextRadius) const;

  private:
    std::shared_ptr<const LineAligner> m_pAligner;
};

#endif
