// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef FILEACTIONS_H
#define FILEACTIONS_H

#include "DiffEntry.h"

#include <QString>

enum class e_EntryAction
{
    Copy,     // one sided entries: copy to the other side
    Delete,   // one sided entries: remove from the side where it exists
    UseLeft,  // type mismatch: replace the right entry by the left one
    UseRight, // type mismatch: replace the left entry by the right one
    Skip
};

/*
    Carries out file level resolutions below the two roots. In dry run mode nothing is
    touched, every action is only logged.
*/
class FileActions
{
  public:
    FileActions(const QString& leftRoot, const QString& rightRoot, bool bDryRun);
    virtual ~FileActions() = default;

    virtual bool apply(const DiffEntry& entry, e_EntryAction action);
    // Replaces the content of both files by the given texts encoded as UTF-8.
    virtual bool writeMerged(const QString& relPath, const QString& newLeftText, const QString& newRightText);

    [[nodiscard]] bool isDryRun() const { return m_bDryRun; }
    [[nodiscard]] QString leftPath(const QString& relPath) const { return m_leftRoot + '/' + relPath; }
    [[nodiscard]] QString rightPath(const QString& relPath) const { return m_rightRoot + '/' + relPath; }

    [[nodiscard]] const QString& errorString() const { return mErrorString; }

  protected:
    void setErrorString(const QString& s) { mErrorString = s; }

  private:
    bool copy(const QString& srcPath, const QString& destPath);
    bool remove(const QString& path);
    bool replace(const QString& srcPath, const QString& destPath);
    bool write(const QString& path, const QString& text);

    QString m_leftRoot;
    QString m_rightRoot;
    bool m_bDryRun = false;

    QString mErrorString;
};

#endif
