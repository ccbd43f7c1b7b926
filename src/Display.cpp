// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Display.h"

#include "compat.h"

#include <QStringList>

QString Display::describeEntry(const DiffEntry& entry, qint32 index, qint32 total, qint32 hunkCount)
{
    QStringList out;
    out.append(QStringLiteral("[%1/%2] ").arg(index + 1).arg(total) + i18n("File:") + ' ' + entry.path());

    const auto typeName = [](bool bDir) { return bDir ? i18n("directory") : i18n("file"); };

    switch(entry.kind())
    {
        case e_DiffKind::LeftOnly:
            out.append("  " + typeName(entry.isDir()) + ' ' + i18n("(only in left)"));
            break;
        case e_DiffKind::RightOnly:
            out.append("  " + typeName(entry.isDir()) + ' ' + i18n("(only in right)"));
            break;
        case e_DiffKind::Modified:
            if(entry.hasError())
                out.append("  " + i18n("error:") + ' ' + entry.errorText());
            else if(hunkCount >= 0)
                out.append("  " + i18n("modified") + QStringLiteral(" (%1 ").arg(hunkCount) + i18n("hunk(s)") + ')');
            else
                out.append("  " + i18n("modified"));
            break;
        case e_DiffKind::TypeMismatch:
            out.append("  " + i18n("type mismatch:") + ' ' + i18n("left is") + ' ' + typeName(entry.isDirLeft().value_or(false)) +
                       ", " + i18n("right is") + ' ' + typeName(entry.isDirRight().value_or(false)));
            break;
    }

    return out.join('\n');
}

QString Display::describeHunk(const Hunk& hunk, qint32 index, qint32 total, const QString& path)
{
    const bool bWhitespaceOnly = isWhitespaceOnly(hunk);
    QStringList out;

    QString header = QStringLiteral("[%1/%2] ").arg(index + 1).arg(total) + i18n("Hunk in") + ' ' + path;
    if(bWhitespaceOnly)
        header += ' ' + i18n("(whitespace only)");
    out.append(header);

    out.append(QStringLiteral("  @@ -%1,%2 +%3,%4 @@")
                   .arg(hunk.leftStart() + 1)
                   .arg(hunk.leftCount())
                   .arg(hunk.rightStart() + 1)
                   .arg(hunk.rightCount()));

    appendLines(out, hunk.contextBefore(), ' ', bWhitespaceOnly);
    appendLines(out, hunk.leftLines(), '-', bWhitespaceOnly);
    appendLines(out, hunk.rightLines(), '+', bWhitespaceOnly);
    appendLines(out, hunk.contextAfter(), ' ', bWhitespaceOnly);

    return out.join('\n');
}

QString Display::describeSummary(const SessionSummary& summary, bool bDryRun)
{
    QStringList out;

    if(summary.bQuit)
        out.append(i18n("Merge cancelled."));
    else if(bDryRun)
        out.append(i18n("Dry run complete. No files were modified."));
    else
        out.append(i18n("Merge complete!"));

    const auto addCounter = [&out](qint32 value, const QString& label) {
        if(value > 0)
            out.append(QStringLiteral("  %1: %2").arg(label).arg(value));
    };

    addCounter(summary.hunksDecided, i18n("Hunks decided"));
    addCounter(summary.leftChoices, i18n("Used left"));
    addCounter(summary.rightChoices, i18n("Used right"));
    addCounter(summary.skipped, i18n("Skipped"));
    addCounter(summary.copies, i18n("Copied"));
    addCounter(summary.deletes, i18n("Deleted"));
    addCounter(summary.errors, i18n("Errors"));

    return out.join('\n');
}

void Display::appendLines(QStringList& out, const QStringList& lines, QChar marker, bool bVisualize)
{
    for(const QString& line: lines)
        out.append(QStringLiteral("  ") + marker + (bVisualize ? visualizeWhitespace(line) : trimEnd(line)));
}

bool Display::isWhitespaceOnly(const Hunk& hunk)
{
    return stripWhitespace(hunk.leftLines()) == stripWhitespace(hunk.rightLines());
}

QString Display::stripWhitespace(const QStringList& lines)
{
    QString result;
    for(const QString& line: lines)
    {
        for(const QChar c: line)
        {
            if(!c.isSpace())
                result.append(c);
        }
    }
    return result;
}

QString Display::visualizeWhitespace(const QString& line)
{
    QString result;
    result.reserve(line.length());

    for(const QChar c: line)
    {
        switch(c.unicode())
        {
            case ' ':
                result.append(QChar(0x00B7));
                break;
            case '\t':
                result.append(QChar(0x2192));
                break;
            case '\n':
                result.append(QChar(0x21B5));
                break;
            case '\r':
                result.append(QChar(0x240D));
                break;
            default:
                result.append(c);
        }
    }
    return result;
}

QString Display::trimEnd(const QString& line)
{
    QtSizeType end = line.length();
    while(end > 0 && line.at(end - 1).isSpace())
        --end;

    return line.left(end);
}
