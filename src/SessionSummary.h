// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef SESSIONSUMMARY_H
#define SESSIONSUMMARY_H

#include <QtGlobal>

class SessionSummary
{
  public:
    qint32 hunksDecided = 0;
    qint32 leftChoices = 0;
    qint32 rightChoices = 0;
    qint32 skipped = 0; // hunks and entries
    qint32 copies = 0;
    qint32 deletes = 0;
    qint32 errors = 0;
    bool bQuit = false;

    // Process exit status once the session is over: 2 if any entry failed, 0 otherwise.
    [[nodiscard]] qint32 exitCode() const { return errors > 0 ? 2 : 0; }

    SessionSummary& operator+=(const SessionSummary& other)
    {
        hunksDecided += other.hunksDecided;
        leftChoices += other.leftChoices;
        rightChoices += other.rightChoices;
        skipped += other.skipped;
        copies += other.copies;
        deletes += other.deletes;
        errors += other.errors;
        bQuit = bQuit || other.bQuit;
        return *this;
    }
};

#endif
