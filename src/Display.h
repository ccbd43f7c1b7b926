// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef DISPLAY_H
#define DISPLAY_H

#include "DiffEntry.h"
#include "Hunk.h"
#include "SessionSummary.h"

#include <QString>

// Plain text rendering of entries and hunks for the console.
class Display
{
  public:
    // index is zero based. hunkCount < 0 means the hunks of a modified entry are not known.
    static QString describeEntry(const DiffEntry& entry, qint32 index, qint32 total, qint32 hunkCount = -1);
    static QString describeHunk(const Hunk& hunk, qint32 index, qint32 total, const QString& path);
    // Final report: outcome line followed by the non zero counters.
    static QString describeSummary(const SessionSummary& summary, bool bDryRun);

    // True if both sides are equal once all whitespace is removed.
    static bool isWhitespaceOnly(const Hunk& hunk);
    static QString visualizeWhitespace(const QString& line);
    static QString trimEnd(const QString& line);

  private:
    static QString stripWhitespace(const QStringList& lines);
    static void appendLines(QStringList& out, const QStringList& lines, QChar marker, bool bVisualize);
};

#endif
