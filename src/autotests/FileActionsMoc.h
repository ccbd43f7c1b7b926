/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef FILEACTIONSMOC_H
#define FILEACTIONSMOC_H

#include "../FileActions.h"

#include <vector>

#include <QString>

// Records merged writes instead of touching the disk.
class FileActionsMoc: public FileActions
{
  public:
    class Write
    {
      public:
        QString relPath;
        QString left;
        QString right;
    };

    FileActionsMoc(): FileActions(QStringLiteral("/left"), QStringLiteral("/right"), false) {}

    bool writeMerged(const QString& relPath, const QString& newLeftText, const QString& newRightText) override
    {
        if(m_bFailWrites)
        {
            setErrorString(QStringLiteral("simulated failure"));
            return false;
        }

        writes.push_back(Write{relPath, newLeftText, newRightText});
        return true;
    }

    void setFailWrites(bool bFail) { m_bFailWrites = bFail; }

    std::vector<Write> writes;

  private:
    bool m_bFailWrites = false;
};

#endif
