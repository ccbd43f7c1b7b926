// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef DIRECTORYMERGESESSION_H
#define DIRECTORYMERGESESSION_H

#include "DiffEntry.h"
#include "DirectoryComparator.h"
#include "FileComparator.h"
#include "LineAligner.h"
#include "MyersAligner.h"
#include "PatternIgnoreList.h"
#include "SessionSummary.h"

#include <memory>

#include <boost/signals2.hpp>

#include <QSharedPointer>
#include <QString>
#include <QStringList>

class DecisionSource;
class FileActions;
class Options;

class DirectoryMergeSession
{
  public:
    DirectoryMergeSession(const QString& leftRoot, const QString& rightRoot, const QSharedPointer<const Options>& pOptions,
                          DecisionSource& decisions, FileActions& actions);

    // Only needed before compare(). Defaults are built from the options.
    void setComparator(const std::shared_ptr<DirectoryComparator>& pComparator) { m_pComparator = pComparator; }
    void setFileComparator(const std::shared_ptr<const FileComparator>& pFileComparator) { m_pFileComparator = pFileComparator; }
    void setAligner(const std::shared_ptr<const LineAligner>& pAligner) { m_pAligner = pAligner; }

    // Returns false if the exclusion patterns are invalid or a root can not be walked. See errorString().
    bool compare();
    [[nodiscard]] const DiffEntryList& entries() const { return m_entries; }

    // Compares first if compare() was not called yet.
    SessionSummary run();

    [[nodiscard]] const QString& errorString() const { return mErrorString; }
    [[nodiscard]] const QStringList& errors() const { return mErrors; }

    // entry, zero based index, number of entries
    boost::signals2::signal<void(const DiffEntry&, qint32, qint32)> entryStarted;
    // path, zero based hunk index
    boost::signals2::signal<void(const QString&, qint32)> hunkApplied;
    // Informational and error messages for the user.
    boost::signals2::signal<void(const QString&)> message;

  private:
    bool processEntry(const DiffEntry& entry, qint32 index, qint32 total, SessionSummary& summary);
    bool processOneSided(const DiffEntry& entry, SessionSummary& summary);
    bool processModified(const DiffEntry& entry, qint32 index, qint32 total, SessionSummary& summary);
    [[nodiscard]] bool isBinaryEntry(const QString& path);
    void reportError(const QString& text, SessionSummary& summary);

    QString m_leftRoot;
    QString m_rightRoot;
    QSharedPointer<const Options> m_pOptions;
    DecisionSource& m_decisions;
    FileActions& m_actions;

    std::shared_ptr<DirectoryComparator> m_pComparator;
    std::shared_ptr<const FileComparator> m_pFileComparator;
    std::shared_ptr<const LineAligner> m_pAligner = std::make_shared<MyersAligner>();
    PatternIgnoreList m_ignoreList;

    bool m_bCompared = false;
    DiffEntryList m_entries;
    QString mErrorString;
    QStringList mErrors;
};

#endif
