// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef HUNKRECONCILER_H
#define HUNKRECONCILER_H

#include "Hunk.h"
#include "LineAligner.h"
#include "MyersAligner.h"

#include <memory>

#include <QString>
#include <QStringList>

class TextLines;

class ReconciledTexts
{
  public:
    QString left;
    QString right;
};

/*
    Rebuilds both texts from one choice per non equal edit operation. The alignment is recomputed
    from the texts so choices line up with the hunks HunkExtractor produced for the same texts.
*/
class HunkReconciler
{
  public:
    explicit HunkReconciler(const std::shared_ptr<const LineAligner>& pAligner = std::make_shared<MyersAligner>()): m_pAligner(pAligner) {}

    [[nodiscard]] ReconciledTexts reconcile(const QString& leftText, const QString& rightText, const HunkChoiceList& choices) const;

    // Trailing newline of each output: the last decisive choice wins, otherwise each side keeps its own.
    static void resolveTrailingNewlines(const HunkChoiceList& choices, bool bLeftHasEOL, bool bRightHasEOL,
                                        bool& bNewLeftEOL, bool& bNewRightEOL);

  private:
    static void appendLines(const TextLines& source, LineType first, LineCount count, QStringList& buffer);

    std::shared_ptr<const LineAligner> m_pAligner;
};

#endif
