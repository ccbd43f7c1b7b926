// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef FILEMERGESESSION_H
#define FILEMERGESESSION_H

#include "Hunk.h"
#include "HunkExtractor.h"
#include "HunkReconciler.h"
#include "LineAligner.h"
#include "SessionSummary.h"

#include <memory>

#include <boost/signals2.hpp>

#include <QSharedPointer>
#include <QString>

class DecisionSource;
class FileActions;
class Options;

enum class e_FileMergeOutcome
{
    Completed,
    SkippedFile,
    Quit,
    WriteFailed
};

class FileMergeResult
{
  public:
    e_FileMergeOutcome outcome = e_FileMergeOutcome::Completed;
    qint32 totalHunks = 0;
    SessionSummary summary;
    QString errorText;
};

/*
    Walks the hunks of one modified file pair, asking for one decision per hunk.
    Each decisive choice rebuilds both files from all choices made so far and rewrites them,
    so the files on disk are always complete. With WriteAfterEachHunk off a single write
    happens once the decisions for the file are done.
*/
class FileMergeSession
{
  public:
    FileMergeSession(const QSharedPointer<const Options>& pOptions, DecisionSource& decisions, FileActions& actions,
                     const std::shared_ptr<const LineAligner>& pAligner = std::make_shared<MyersAligner>());

    FileMergeResult run(const QString& leftText, const QString& rightText, const QString& relPath);

    // path, zero based hunk index
    boost::signals2::signal<void(const QString&, qint32)> hunkApplied;

  private:
    bool writeMerged(const QString& leftText, const QString& rightText, const QString& relPath, const HunkChoiceList& choices, FileMergeResult& result);

    QSharedPointer<const Options> m_pOptions;
    DecisionSource& m_decisions;
    FileActions& m_actions;
    HunkExtractor m_extractor;
    HunkReconciler m_reconciler;
};

#endif
