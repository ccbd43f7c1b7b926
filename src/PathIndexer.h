// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef PATHINDEXER_H
#define PATHINDEXER_H

#include "fileaccess.h"

#include <map>

#include <QString>

/*
    Orders relative paths component by component: "a" < "a/b" < "a-b".
    Independent of the order the file system lists entries in.
*/
class PathLess
{
  public:
    bool operator()(const QString& a, const QString& b) const;
};

using PathIndex = std::map<QString, FileAccess, PathLess>;

/*
    Collects every entry below a root folder keyed by its '/' separated path relative to the root.
    Linked folders are listed as entries but not descended into.
*/
class PathIndexer
{
  public:
    virtual ~PathIndexer() = default;

    virtual bool index(const QString& root, PathIndex& result);

    [[nodiscard]] const QString& errorString() const { return mErrorString; }

  protected:
    void setErrorString(const QString& s) { mErrorString = s; }

  private:
    QString mErrorString;
};

#endif
