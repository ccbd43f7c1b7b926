// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "FileActions.h"

#include "compat.h"
#include "fileaccess.h"
#include "Logging.h"

#include <QDir>

FileActions::FileActions(const QString& leftRoot, const QString& rightRoot, bool bDryRun):
    m_leftRoot(QDir::cleanPath(leftRoot)),
    m_rightRoot(QDir::cleanPath(rightRoot)),
    m_bDryRun(bDryRun)
{
}

bool FileActions::apply(const DiffEntry& entry, e_EntryAction action)
{
    const QString& relPath = entry.path();
    setErrorString(QString());

    if(action == e_EntryAction::Skip)
        return true;

    switch(entry.kind())
    {
        case e_DiffKind::LeftOnly:
            if(action == e_EntryAction::Copy)
                return copy(leftPath(relPath), rightPath(relPath));
            if(action == e_EntryAction::Delete)
                return remove(leftPath(relPath));
            break;
        case e_DiffKind::RightOnly:
            if(action == e_EntryAction::Copy)
                return copy(rightPath(relPath), leftPath(relPath));
            if(action == e_EntryAction::Delete)
                return remove(rightPath(relPath));
            break;
        case e_DiffKind::TypeMismatch:
            if(action == e_EntryAction::UseLeft)
                return replace(leftPath(relPath), rightPath(relPath));
            if(action == e_EntryAction::UseRight)
                return replace(rightPath(relPath), leftPath(relPath));
            break;
        case e_DiffKind::Modified:
            break;
    }

    setErrorString(i18n("Action not supported for %1.", relPath));
    return false;
}

bool FileActions::writeMerged(const QString& relPath, const QString& newLeftText, const QString& newRightText)
{
    setErrorString(QString());
    return write(leftPath(relPath), newLeftText) && write(rightPath(relPath), newRightText);
}

bool FileActions::copy(const QString& srcPath, const QString& destPath)
{
    if(m_bDryRun)
    {
        qCInfo(ddmergeFileAccess) << "Dry run: copy" << srcPath << "->" << destPath;
        return true;
    }

    FileAccess src(srcPath);
    if(!src.copyTree(destPath))
    {
        setErrorString(src.getStatusText());
        return false;
    }
    return true;
}

bool FileActions::remove(const QString& path)
{
    if(m_bDryRun)
    {
        qCInfo(ddmergeFileAccess) << "Dry run: delete" << path;
        return true;
    }

    FileAccess target(path);
    if(!target.removeTree())
    {
        setErrorString(target.getStatusText());
        return false;
    }
    return true;
}

bool FileActions::replace(const QString& srcPath, const QString& destPath)
{
    return remove(destPath) && copy(srcPath, destPath);
}

bool FileActions::write(const QString& path, const QString& text)
{
    if(m_bDryRun)
    {
        qCInfo(ddmergeFileAccess) << "Dry run: write" << text.length() << "characters to" << path;
        return true;
    }

    FileAccess target(path);
    if(!target.writeFile(text.toUtf8()))
    {
        setErrorString(target.getStatusText().isEmpty() ? i18n("Writing %1 failed.", path) : target.getStatusText());
        return false;
    }
    return true;
}
