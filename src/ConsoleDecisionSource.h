// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef CONSOLEDECISIONSOURCE_H
#define CONSOLEDECISIONSOURCE_H

#include "DecisionSource.h"

#include <QTextStream>

/*
    Prompts on a text stream and reads single letter answers. Invalid answers are asked again,
    the end of the input counts as quit.
*/
class ConsoleDecisionSource: public DecisionSource
{
  public:
    ConsoleDecisionSource(QTextStream& in, QTextStream& out): m_in(in), m_out(out) {}

    HunkDecision hunkDecision(const Hunk& hunk, qint32 index, qint32 total, const QString& path) override;
    EntryDecision entryDecision(const DiffEntry& entry) override;

  private:
    // Returns false at the end of the input.
    bool ask(const QString& prompt, const QString& validAnswers, QChar& answer);

    QTextStream& m_in;
    QTextStream& m_out;
};

#endif
