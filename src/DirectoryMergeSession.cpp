// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "DirectoryMergeSession.h"

#include "compat.h"
#include "DecisionSource.h"
#include "FileActions.h"
#include "FileMergeSession.h"
#include "fileaccess.h"
#include "Logging.h"
#include "options.h"
#include "SourceData.h"

DirectoryMergeSession::DirectoryMergeSession(const QString& leftRoot, const QString& rightRoot, const QSharedPointer<const Options>& pOptions,
                                             DecisionSource& decisions, FileActions& actions):
    m_leftRoot(leftRoot),
    m_rightRoot(rightRoot),
    m_pOptions(pOptions),
    m_decisions(decisions),
    m_actions(actions)
{
}

bool DirectoryMergeSession::compare()
{
    m_entries.clear();
    mErrors.clear();
    mErrorString.clear();
    m_bCompared = false;

    if(!m_ignoreList.setPatterns(m_pOptions->excludeRegexLeft(), m_pOptions->excludeRegexRight()))
    {
        mErrorString = m_ignoreList.errorString();
        return false;
    }

    if(m_pFileComparator == nullptr)
        m_pFileComparator = std::make_shared<FileComparator>(m_pOptions->binaryProbeSize());
    if(m_pComparator == nullptr)
        m_pComparator = std::make_shared<DirectoryComparator>(std::make_shared<PathIndexer>(), m_pFileComparator);

    if(!m_pComparator->compare(m_leftRoot, m_rightRoot, m_entries))
    {
        mErrorString = m_pComparator->errorString();
        return false;
    }

    m_bCompared = true;
    return true;
}

SessionSummary DirectoryMergeSession::run()
{
    SessionSummary summary;

    if(!m_bCompared && !compare())
    {
        reportError(mErrorString, summary);
        return summary;
    }

    const qint32 total = static_cast<qint32>(m_entries.size());
    for(qint32 i = 0; i < total; ++i)
    {
        const DiffEntry& entry = m_entries[i];
        if(m_ignoreList.matches(entry))
            continue;

        if(!processEntry(entry, i, total, summary))
        {
            qCInfo(ddmergeMain) << "Merge cancelled at" << entry.path();
            summary.bQuit = true;
            break;
        }
    }

    return summary;
}

// Returns false when the user quits.
bool DirectoryMergeSession::processEntry(const DiffEntry& entry, qint32 index, qint32 total, SessionSummary& summary)
{
    if(entry.isOneSided() && !entry.isDir() && m_pOptions->skipBinary())
    {
        const QString path = entry.kind() == e_DiffKind::LeftOnly ? m_actions.leftPath(entry.path()) : m_actions.rightPath(entry.path());
        if(isBinaryEntry(path))
        {
            ++summary.skipped;
            return true;
        }
    }

    if(entry.kind() == e_DiffKind::Modified)
        return processModified(entry, index, total, summary);

    entryStarted(entry, index, total);
    return processOneSided(entry, summary);
}

bool DirectoryMergeSession::processOneSided(const DiffEntry& entry, SessionSummary& summary)
{
    const EntryDecision decision = m_decisions.entryDecision(entry);
    if(decision.isQuit())
        return false;

    const e_EntryAction action = decision.getAction();
    if(action == e_EntryAction::Skip)
    {
        ++summary.skipped;
        return true;
    }

    if(!m_actions.apply(entry, action))
    {
        reportError(i18n("%1: %2", entry.path(), m_actions.errorString()), summary);
        return true;
    }

    if(action == e_EntryAction::Delete)
        ++summary.deletes;
    else
        ++summary.copies;
    return true;
}

bool DirectoryMergeSession::processModified(const DiffEntry& entry, qint32 index, qint32 total, SessionSummary& summary)
{
    if(entry.hasError())
    {
        reportError(i18n("%1: %2", entry.path(), entry.errorText()), summary);
        return true;
    }

    FileAccess leftFile(m_actions.leftPath(entry.path()));
    FileAccess rightFile(m_actions.rightPath(entry.path()));
    SourceData leftData, rightData;
    QString status;

    if(!m_pFileComparator->readAsText(leftFile, leftData, status) || !m_pFileComparator->readAsText(rightFile, rightData, status))
    {
        reportError(i18n("%1: %2", entry.path(), status), summary);
        return true;
    }

    if(leftData.isBinary() || rightData.isBinary())
    {
        if(!m_pOptions->skipBinary())
            message(i18n("%1 (binary file - skipping)", entry.path()));
        ++summary.skipped;
        return true;
    }

    entryStarted(entry, index, total);

    FileMergeSession fileSession(m_pOptions, m_decisions, m_actions, m_pAligner);
    fileSession.hunkApplied.connect([this](const QString& path, qint32 hunkIndex) { hunkApplied(path, hunkIndex); });

    const FileMergeResult result = fileSession.run(leftData.getText(), rightData.getText(), entry.path());
    summary += result.summary;

    if(result.outcome == e_FileMergeOutcome::WriteFailed)
    {
        mErrors.append(i18n("%1: %2", entry.path(), result.errorText));
        message(mErrors.back());
    }

    return result.outcome != e_FileMergeOutcome::Quit;
}

bool DirectoryMergeSession::isBinaryEntry(const QString& path)
{
    FileAccess file(path);
    bool bError = false;
    QString status;

    const bool bBinary = m_pFileComparator->isBinary(file, bError, status);
    if(bError)
        qCWarning(ddmergeMain) << "Binary check failed:" << status;
    return bBinary;
}

void DirectoryMergeSession::reportError(const QString& text, SessionSummary& summary)
{
    qCWarning(ddmergeMain) << text;
    mErrors.append(text);
    ++summary.errors;
    message(text);
}
