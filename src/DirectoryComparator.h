// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef DIRECTORYCOMPARATOR_H
#define DIRECTORYCOMPARATOR_H

#include "DiffEntry.h"
#include "FileComparator.h"
#include "PathIndexer.h"

#include <memory>
#include <set>

#include <QString>
#include <QStringList>

class DirectoryComparator
{
  public:
    explicit DirectoryComparator(const std::shared_ptr<PathIndexer>& pIndexer = std::make_shared<PathIndexer>(),
                                 const std::shared_ptr<const FileComparator>& pFileComparator = std::make_shared<FileComparator>());

    /*
        Classifies every path that differs between the two trees, ordered by PathLess.
        Returns false if either root can not be walked. Failures on single entries are
        attached to the entry and collected in errors().
    */
    bool compare(const QString& leftRoot, const QString& rightRoot, DiffEntryList& entries);

    [[nodiscard]] const QString& errorString() const { return mErrorString; }
    [[nodiscard]] const QStringList& errors() const { return mErrors; }

  private:
    void classifyPair(const QString& path, const FileAccess& left, const FileAccess& right, DiffEntryList& entries);
    static bool hasAncestorIn(const QString& path, const std::set<QString>& dirs);
    static void suppressNested(DiffEntryList& entries);

    std::shared_ptr<PathIndexer> m_pIndexer;
    std::shared_ptr<const FileComparator> m_pFileComparator;

    QString mErrorString;
    QStringList mErrors;
};

#endif
