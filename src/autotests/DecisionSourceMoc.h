/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef DECISIONSOURCEMOC_H
#define DECISIONSOURCEMOC_H

#include "../DecisionSource.h"

#include <deque>

#include <QStringList>

/*
    Plays back scripted decisions. Once a script runs dry hunks are skipped and
    entries quit, so a broken test can not loop forever.
*/
class DecisionSourceMoc: public DecisionSource
{
  public:
    HunkDecision hunkDecision(const Hunk& /*hunk*/, qint32 index, qint32 total, const QString& path) override
    {
        askedHunks.append(QStringLiteral("%1:%2/%3").arg(path).arg(index).arg(total));
        if(hunkScript.empty())
            return HunkDecision::choice(e_HunkChoice::Skip);

        const HunkDecision decision = hunkScript.front();
        hunkScript.pop_front();
        return decision;
    }

    EntryDecision entryDecision(const DiffEntry& entry) override
    {
        askedEntries.append(entry.path());
        if(entryScript.empty())
            return EntryDecision::quit();

        const EntryDecision decision = entryScript.front();
        entryScript.pop_front();
        return decision;
    }

    std::deque<HunkDecision> hunkScript;
    std::deque<EntryDecision> entryScript;

    QStringList askedHunks;
    QStringList askedEntries;
};

#endif
