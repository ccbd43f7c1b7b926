// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "DirectoryComparator.h"

#include "compat.h"
#include "Logging.h"

#include <algorithm>

DirectoryComparator::DirectoryComparator(const std::shared_ptr<PathIndexer>& pIndexer,
                                         const std::shared_ptr<const FileComparator>& pFileComparator):
    m_pIndexer(pIndexer),
    m_pFileComparator(pFileComparator)
{
}

bool DirectoryComparator::compare(const QString& leftRoot, const QString& rightRoot, DiffEntryList& entries)
{
    entries.clear();
    mErrors.clear();
    mErrorString.clear();

    PathIndex leftIndex, rightIndex;
    if(!m_pIndexer->index(leftRoot, leftIndex))
    {
        mErrorString = i18n("Reading left folder failed: %1", m_pIndexer->errorString());
        return false;
    }

    if(!m_pIndexer->index(rightRoot, rightIndex))
    {
        mErrorString = i18n("Reading right folder failed: %1", m_pIndexer->errorString());
        return false;
    }

    // Both indexes share the same ordering so walking them side by side yields the ordered union.
    const PathLess less;
    PathIndex::const_iterator itLeft = leftIndex.cbegin();
    PathIndex::const_iterator itRight = rightIndex.cbegin();
    while(itLeft != leftIndex.cend() || itRight != rightIndex.cend())
    {
        if(itRight == rightIndex.cend() || (itLeft != leftIndex.cend() && less(itLeft->first, itRight->first)))
        {
            entries.push_back(DiffEntry::leftOnly(itLeft->first, itLeft->second.isDir()));
            ++itLeft;
        }
        else if(itLeft == leftIndex.cend() || less(itRight->first, itLeft->first))
        {
            entries.push_back(DiffEntry::rightOnly(itRight->first, itRight->second.isDir()));
            ++itRight;
        }
        else
        {
            classifyPair(itLeft->first, itLeft->second, itRight->second, entries);
            ++itLeft;
            ++itRight;
        }
    }

    suppressNested(entries);

    qCInfo(ddmergeDirectoryCompare) << "Compared" << leftRoot << "with" << rightRoot << ":" << entries.size() << "differences," << mErrors.size() << "errors.";
    return true;
}

void DirectoryComparator::classifyPair(const QString& path, const FileAccess& left, const FileAccess& right, DiffEntryList& entries)
{
    const bool bDirLeft = left.isDir();
    const bool bDirRight = right.isDir();

    if(bDirLeft != bDirRight)
    {
        entries.push_back(DiffEntry::typeMismatch(path, bDirLeft));
        return;
    }

    if(bDirLeft)
        return;

    FileAccess fi1 = left;
    FileAccess fi2 = right;
    bool bError = false;
    QString status;

    const bool bEqual = m_pFileComparator->identical(fi1, fi2, bError, status);
    if(bError)
    {
        qCWarning(ddmergeDirectoryCompare) << "Comparing" << path << "failed:" << status;

        DiffEntry entry = DiffEntry::modified(path);
        entry.setErrorText(status);
        entries.push_back(entry);
        mErrors.append(i18n("%1: %2", path, status));
    }
    else if(!bEqual)
    {
        entries.push_back(DiffEntry::modified(path));
    }
}

bool DirectoryComparator::hasAncestorIn(const QString& path, const std::set<QString>& dirs)
{
    QtSizeType pos = path.lastIndexOf('/');
    while(pos > 0)
    {
        if(dirs.count(path.left(pos)) != 0)
            return true;

        pos = path.lastIndexOf('/', pos - 1);
    }

    return false;
}

/*
    Drops one sided entries below a one sided folder of the same side. The folder sets are
    collected before filtering so every ancestor level counts, including suppressed ones.
*/
void DirectoryComparator::suppressNested(DiffEntryList& entries)
{
    std::set<QString> leftOnlyDirs, rightOnlyDirs;
    for(const DiffEntry& entry: entries)
    {
        if(entry.kind() == e_DiffKind::LeftOnly && entry.isDir())
            leftOnlyDirs.insert(entry.path());
        else if(entry.kind() == e_DiffKind::RightOnly && entry.isDir())
            rightOnlyDirs.insert(entry.path());
    }

    const DiffEntryList::iterator newEnd = std::remove_if(entries.begin(), entries.end(), [&leftOnlyDirs, &rightOnlyDirs](const DiffEntry& entry) {
        bool bSuppress = false;
        if(entry.kind() == e_DiffKind::LeftOnly)
            bSuppress = hasAncestorIn(entry.path(), leftOnlyDirs);
        else if(entry.kind() == e_DiffKind::RightOnly)
            bSuppress = hasAncestorIn(entry.path(), rightOnlyDirs);

        if(bSuppress)
            qCDebug(ddmergeDirectoryCompare) << "Suppressing nested entry" << entry;
        return bSuppress;
    });

    entries.erase(newEnd, entries.end());
}
