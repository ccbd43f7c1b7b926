// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "ConsoleDecisionSource.h"

#include "compat.h"
#include "Display.h"

bool ConsoleDecisionSource::ask(const QString& prompt, const QString& validAnswers, QChar& answer)
{
    for(;;)
    {
        m_out << prompt << ' ' << Qt::flush;

        QString line;
        if(!m_in.readLineInto(&line))
            return false;

        line = line.trimmed().toLower();
        if(line.length() == 1 && validAnswers.contains(line.at(0)))
        {
            answer = line.at(0);
            return true;
        }

        m_out << i18n("Invalid choice, please try again.") << Qt::endl;
    }
}

HunkDecision ConsoleDecisionSource::hunkDecision(const Hunk& hunk, qint32 index, qint32 total, const QString& path)
{
    m_out << Qt::endl << Display::describeHunk(hunk, index, total, path) << Qt::endl;

    QChar answer;
    if(!ask(i18n("[l]eft (update right), [r]ight (update left), [s]kip, skip [f]ile, [q]uit?"), QStringLiteral("lrsfq"), answer))
        return HunkDecision::quit();

    switch(answer.unicode())
    {
        case 'l':
            return HunkDecision::choice(e_HunkChoice::Left);
        case 'r':
            return HunkDecision::choice(e_HunkChoice::Right);
        case 'f':
            return HunkDecision::skipFile();
        case 'q':
            return HunkDecision::quit();
        default:
            return HunkDecision::choice(e_HunkChoice::Skip);
    }
}

EntryDecision ConsoleDecisionSource::entryDecision(const DiffEntry& entry)
{
    QChar answer;

    if(entry.kind() == e_DiffKind::TypeMismatch)
    {
        if(!ask(i18n("Use [l]eft, use [r]ight, [s]kip, [q]uit?"), QStringLiteral("lrsq"), answer))
            return EntryDecision::quit();

        switch(answer.unicode())
        {
            case 'l':
                return EntryDecision::action(e_EntryAction::UseLeft);
            case 'r':
                return EntryDecision::action(e_EntryAction::UseRight);
            case 'q':
                return EntryDecision::quit();
            default:
                return EntryDecision::action(e_EntryAction::Skip);
        }
    }

    const QString prompt = entry.kind() == e_DiffKind::LeftOnly ? i18n("[c]opy to right, [d]elete from left, [s]kip, [q]uit?")
                                                                  : i18n("[c]opy to left, [d]elete from right, [s]kip, [q]uit?");
    if(!ask(prompt, QStringLiteral("cdsq"), answer))
        return EntryDecision::quit();

    switch(answer.unicode())
    {
        case 'c':
            return EntryDecision::action(e_EntryAction::Copy);
        case 'd':
            return EntryDecision::action(e_EntryAction::Delete);
        case 'q':
            return EntryDecision::quit();
        default:
            return EntryDecision::action(e_EntryAction::Skip);
    }
}
