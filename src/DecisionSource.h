// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef DECISIONSOURCE_H
#define DECISIONSOURCE_H

#include "DiffEntry.h"
#include "FileActions.h"
#include "Hunk.h"

#include <QString>

class HunkDecision
{
  public:
    enum class e_Kind
    {
        Choice,
        SkipFile,
        Quit
    };

    HunkDecision() = default;
    [[nodiscard]] static HunkDecision choice(e_HunkChoice c) { return HunkDecision(e_Kind::Choice, c); }
    [[nodiscard]] static HunkDecision skipFile() { return HunkDecision(e_Kind::SkipFile, e_HunkChoice::Skip); }
    [[nodiscard]] static HunkDecision quit() { return HunkDecision(e_Kind::Quit, e_HunkChoice::Skip); }

    [[nodiscard]] e_Kind kind() const { return mKind; }
    [[nodiscard]] e_HunkChoice getChoice() const { return mChoice; }

  private:
    HunkDecision(e_Kind kind, e_HunkChoice c): mKind(kind), mChoice(c) {}

    e_Kind mKind = e_Kind::Choice;
    e_HunkChoice mChoice = e_HunkChoice::Skip;
};

class EntryDecision
{
  public:
    EntryDecision() = default;
    [[nodiscard]] static EntryDecision action(e_EntryAction a) { return EntryDecision(false, a); }
    [[nodiscard]] static EntryDecision quit() { return EntryDecision(true, e_EntryAction::Skip); }

    [[nodiscard]] bool isQuit() const { return m_bQuit; }
    [[nodiscard]] e_EntryAction getAction() const { return mAction; }

  private:
    EntryDecision(bool bQuit, e_EntryAction a): m_bQuit(bQuit), mAction(a) {}

    bool m_bQuit = false;
    e_EntryAction mAction = e_EntryAction::Skip;
};

/*
    Supplies the user's decisions one at a time. index is zero based.
*/
class DecisionSource
{
  public:
    virtual ~DecisionSource() = default;

    virtual HunkDecision hunkDecision(const Hunk& hunk, qint32 index, qint32 total, const QString& path) = 0;
    virtual EntryDecision entryDecision(const DiffEntry& entry) = 0;
};

#endif
