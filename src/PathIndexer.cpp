// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "PathIndexer.h"

#include "compat.h"
#include "DirectoryList.h"
#include "Logging.h"

#include <algorithm>

bool PathLess::operator()(const QString& a, const QString& b) const
{
    const QtSizeType n = std::min(a.size(), b.size());
    for(QtSizeType i = 0; i < n; ++i)
    {
        const QChar ca = a.at(i);
        const QChar cb = b.at(i);
        if(ca == cb)
            continue;

        //A separator ends the component. The shorter component sorts first.
        if(ca == '/')
            return true;
        if(cb == '/')
            return false;

        return ca < cb;
    }

    return a.size() < b.size();
}

bool PathIndexer::index(const QString& root, PathIndex& result)
{
    result.clear();
    setErrorString(QString());

    FileAccess rootDir(root);
    if(!rootDir.exists())
    {
        setErrorString(i18n("Folder %1 does not exist.", root));
        return false;
    }

    if(!rootDir.isDir())
    {
        setErrorString(i18n("%1 is not a folder.", root));
        return false;
    }

    DirectoryList dirList;
    if(!rootDir.listDir(&dirList, true, false))
    {
        setErrorString(i18n("Unable to read folder %1.", root));
        return false;
    }

    for(const FileAccess& entry: dirList)
        result.emplace(entry.fileRelPath(), entry);

    qCInfo(ddmergeFileAccess) << "Indexed" << result.size() << "entries below" << rootDir.absoluteFilePath();
    return true;
}
