// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "FileMergeSession.h"

#include "DecisionSource.h"
#include "FileActions.h"
#include "Logging.h"
#include "options.h"

FileMergeSession::FileMergeSession(const QSharedPointer<const Options>& pOptions, DecisionSource& decisions, FileActions& actions,
                                   const std::shared_ptr<const LineAligner>& pAligner):
    m_pOptions(pOptions),
    m_decisions(decisions),
    m_actions(actions),
    m_extractor(pAligner),
    m_reconciler(pAligner)
{
}

FileMergeResult FileMergeSession::run(const QString& leftText, const QString& rightText, const QString& relPath)
{
    FileMergeResult result;
    const HunkList hunks = m_extractor.extract(leftText, rightText, m_pOptions->contextLines());
    const qint32 total = static_cast<qint32>(hunks.size());
    result.totalHunks = total;

    HunkChoiceList choices;
    bool bPendingWrite = false;

    for(qint32 i = 0; i < total; ++i)
    {
        const HunkDecision decision = m_decisions.hunkDecision(hunks[i], i, total, relPath);
        if(decision.kind() == HunkDecision::e_Kind::Quit)
        {
            result.outcome = e_FileMergeOutcome::Quit;
            result.summary.bQuit = true;
            break;
        }

        if(decision.kind() == HunkDecision::e_Kind::SkipFile)
        {
            result.outcome = e_FileMergeOutcome::SkippedFile;
            result.summary.skipped += total - i;
            break;
        }

        const e_HunkChoice choice = decision.getChoice();
        choices.push_back(choice);
        ++result.summary.hunksDecided;

        if(choice == e_HunkChoice::Skip)
        {
            ++result.summary.skipped;
            continue;
        }

        if(choice == e_HunkChoice::Left)
            ++result.summary.leftChoices;
        else
            ++result.summary.rightChoices;

        if(m_pOptions->writeAfterEachHunk())
        {
            if(!writeMerged(leftText, rightText, relPath, choices, result))
                return result;
        }
        else
            bPendingWrite = true;

        hunkApplied(relPath, i);
    }

    // Decisions taken before a quit or a skipped file are kept.
    if(bPendingWrite)
        writeMerged(leftText, rightText, relPath, choices, result);

    return result;
}

bool FileMergeSession::writeMerged(const QString& leftText, const QString& rightText, const QString& relPath, const HunkChoiceList& choices, FileMergeResult& result)
{
    const ReconciledTexts merged = m_reconciler.reconcile(leftText, rightText, choices);

    qCDebug(ddmergeCore) << "Rewriting" << relPath << "after" << choices.size() << "decisions.";
    if(!m_actions.writeMerged(relPath, merged.left, merged.right))
    {
        qCWarning(ddmergeMain) << "Writing" << relPath << "failed:" << m_actions.errorString();
        result.outcome = e_FileMergeOutcome::WriteFailed;
        result.errorText = m_actions.errorString();
        ++result.summary.errors;
        return false;
    }
    return true;
}
