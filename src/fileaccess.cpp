// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on
#include "fileaccess.h"

#include "compat.h"
#include "Logging.h"
#include "TypeUtils.h"

#include <algorithm>                      // for min
#include <vector>

#include <QDir>
#include <QFile>
#include <QFileInfoList>
#include <QSaveFile>

#ifndef Q_OS_WIN
#include <limits.h> // for PATH_MAX
#include <unistd.h> // for readlink
#endif

FileAccess::FileAccess() = default;

FileAccess::~FileAccess() = default;

FileAccess::FileAccess(const FileAccess&) = default;
FileAccess::FileAccess(FileAccess&&) noexcept = default;
FileAccess& FileAccess::operator=(const FileAccess&) = default;
FileAccess& FileAccess::operator=(FileAccess&&) noexcept = default;

FileAccess::FileAccess(const QString& name)
{
    setFile(name);
}

void FileAccess::reset()
{
    m_name.clear();
    m_fileInfo = QFileInfo();
    m_baseDir = QDir();
    realFile.reset();
    m_statusText.clear();

    m_pParent = nullptr;
    m_bValidData = false;
}

/*
    Needed only during directory listing right now.
*/
void FileAccess::setFile(const FileAccess* pParent, const QFileInfo& fi)
{
    Q_ASSERT(pParent != this);
    reset();

    m_fileInfo = fi;
    m_pParent = pParent;
    loadData();
}

void FileAccess::setFile(const QString& name)
{
    if(name.isEmpty())
        return;

    reset();
    m_fileInfo.setFile(name);
    m_pParent = nullptr;

    loadData();
}

void FileAccess::loadData()
{
    m_fileInfo.setCaching(true);

    if(parent() == nullptr)
        m_baseDir.setPath(m_fileInfo.absoluteFilePath());
    else
        m_baseDir = m_pParent->m_baseDir;

    //convert to absolute path that doesn't depend on the current directory.
    m_fileInfo.makeAbsolute();

    m_name = m_fileInfo.fileName();
    if(m_name.isEmpty())
    {
        m_name = m_fileInfo.absoluteDir().dirName();
    }

    realFile = std::make_shared<QFile>(absoluteFilePath());
    m_bValidData = true;
}

bool FileAccess::isValid() const
{
    return m_bValidData;
}

bool FileAccess::isFile() const
{
    return m_fileInfo.isFile();
}

bool FileAccess::isDir() const
{
    return m_fileInfo.isDir();
}

bool FileAccess::isSymLink() const
{
    return m_fileInfo.isSymLink();
}

bool FileAccess::exists() const
{
    // QFileInfo.exists returns false for broken links
    return m_fileInfo.exists() || isSymLink();
}

qint64 FileAccess::size() const
{
    return m_fileInfo.size();
}

bool FileAccess::isExecutable() const
{
    return m_fileInfo.isExecutable();
}

QString FileAccess::absoluteFilePath() const
{
    return m_fileInfo.absoluteFilePath();
}

QString FileAccess::fileRelPath() const
{
    return m_baseDir.relativeFilePath(m_fileInfo.absoluteFilePath());
}

const FileAccess* FileAccess::parent() const
{
    Q_ASSERT(m_pParent != this);
    return m_pParent;
}

bool FileAccess::open(const QFile::OpenMode flags)
{
    if(realFile == nullptr)
    {
        setStatusText(i18n("Opening %1 failed. No file set.", absoluteFilePath()));
        return false;
    }

    const bool r = realFile->open(flags);
    if(!r)
        setStatusText(i18n("Opening %1 failed. %2", absoluteFilePath(), realFile->errorString()));
    return r;
}

qint64 FileAccess::read(char* data, const qint64 maxlen)
{
    const qint64 len = realFile->read(data, maxlen);
    if(len < 0)
    {
        setStatusText(i18n("Error reading from %1. %2", absoluteFilePath(), realFile->errorString()));
    }
    return len;
}

void FileAccess::close()
{
    if(realFile != nullptr)
        realFile->close();
}

bool FileAccess::readFile(QByteArray& data)
{
    data.clear();
    setStatusText(QString());

    if(!open(QIODevice::ReadOnly))
        return false;

    std::vector<char> buf(maxChunkSize);
    for(;;)
    {
        const qint64 reallyRead = read(buf.data(), (qint64)buf.size());
        if(reallyRead < 0)
        {
            setStatusText(i18n("Failed to read file: %1", absoluteFilePath()));
            close();
            data.clear();
            return false;
        }
        if(reallyRead == 0)
            break;

        data.append(buf.data(), (QtSizeType)reallyRead);
    }

    close();
    return true;
}

bool FileAccess::readPrefix(QByteArray& data, qint64 maxLength)
{
    data.clear();
    setStatusText(QString());

    if(!open(QIODevice::ReadOnly))
        return false;

    data.resize((QtSizeType)maxLength);
    qint64 i = 0;
    while(i < maxLength)
    {
        const qint64 nextLength = std::min(maxLength - i, maxChunkSize);
        const qint64 reallyRead = read(data.data() + i, nextLength);
        if(reallyRead < 0)
        {
            setStatusText(i18n("Failed to read file: %1", absoluteFilePath()));
            close();
            data.clear();
            return false;
        }
        if(reallyRead == 0)
            break;
        i += reallyRead;
    }
    data.truncate((QtSizeType)i);

    close();
    return true;
}

bool FileAccess::writeFile(const QByteArray& data)
{
    setStatusText(QString());
    const bool bWasExecutable = isExecutable(); // value is true if the old file was executable

    // The previous content stays in place until commit() swaps in the complete new file.
    QSaveFile file(absoluteFilePath());
    if(!file.open(QIODevice::WriteOnly))
    {
        setStatusText(i18n("Failed to open file for writing: %1. %2", absoluteFilePath(), file.errorString()));
        return false;
    }

    const qint64 length = data.size();
    qint64 i = 0;
    while(i < length)
    {
        const qint64 nextLength = std::min(length - i, maxChunkSize);
        const qint64 reallyWritten = file.write(data.constData() + i, nextLength);
        if(reallyWritten != nextLength)
        {
            setStatusText(i18n("Failed to write file: %1. %2", absoluteFilePath(), file.errorString()));
            file.cancelWriting();
            return false;
        }
        i += reallyWritten;
    }

    if(!file.commit())
    {
        setStatusText(i18n("Failed to write file: %1. %2", absoluteFilePath(), file.errorString()));
        return false;
    }

    if(bWasExecutable)
    {
        // Preserve attributes
        const QString path = absoluteFilePath();
        if(!QFile::setPermissions(path, QFile::permissions(path) | QFile::ExeUser))
            qCWarning(ddmergeFileAccess) << "Unable to restore executable flag of" << path;
    }
    m_fileInfo.refresh();
    return true;
}

bool FileAccess::listDir(DirectoryList* pDirList, bool bRecursive, bool bFollowDirLinks) const
{
    Q_ASSERT(pDirList != nullptr);
    pDirList->clear();

    qCInfo(ddmergeFileAccess) << "Reading folder: " << absoluteFilePath();

    bool bSuccess = true;
    QDir dir(absoluteFilePath());

    dir.setSorting(QDir::Name | QDir::DirsFirst);
    dir.setFilter(QDir::Files | QDir::Dirs | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);

    const QFileInfoList fiList = dir.entryInfoList();
    if(fiList.isEmpty())
    {
        /*
            Sadly Qt provides no error information making this case ambiguous.
            A readability check is the best we can do.
        */
        bSuccess = isDir() && dir.isReadable();
    }
    else
    {
        for(const QFileInfo& fi: fiList) // for each file...
        {
            Q_ASSERT(fi.fileName() != "." && fi.fileName() != "..");

            FileAccess fa;

            fa.setFile(this, fi);
            pDirList->push_back(fa);
        }
    }

    if(!bSuccess)
    {
        qCWarning(ddmergeFileAccess) << "Unable to read folder: " << absoluteFilePath();
        return false;
    }

    if(bRecursive)
    {
        DirectoryList subDirsList;

        for(const FileAccess& entry: *pDirList)
        {
            Q_ASSERT(entry.isValid());
            if(entry.isDir() && (!entry.isSymLink() || bFollowDirLinks))
            {
                DirectoryList dirList;
                if(!entry.listDir(&dirList, bRecursive, bFollowDirLinks))
                    return false;

                // append data onto the main list
                subDirsList.splice(subDirsList.end(), dirList);
            }
        }

        pDirList->splice(pDirList->end(), subDirsList);
    }

    return true;
}

bool FileAccess::copyFile(const QString& dest)
{
    setStatusText(QString());
    qCInfo(ddmergeFileAccess) << "copy(" << absoluteFilePath() << "->" << dest << ")";

    if(QFileInfo(dest).isFile() || QFileInfo(dest).isSymLink())
    {
        if(!QFile::remove(dest))
        {
            setStatusText(i18n("Error: copy( %1 -> %2 ) failed. Deleting existing destination failed.", absoluteFilePath(), dest));
            return false;
        }
    }

    if(!QFile::copy(absoluteFilePath(), dest))
    {
        setStatusText(i18n("Error: copy( %1 -> %2 ) failed.", absoluteFilePath(), dest));
        return false;
    }
    return true;
}

bool FileAccess::copyTree(const QString& dest)
{
    setStatusText(QString());
    if(!exists())
    {
        setStatusText(i18n("Error: copy( %1 -> %2 ) failed. Source does not exist.", absoluteFilePath(), dest));
        return false;
    }

    if(isSymLink())
        return copyLink(dest);

    if(!isDir())
    {
        const QString parentName = QFileInfo(dest).absolutePath();
        if(!makeDir(parentName))
        {
            setStatusText(i18n("Error while creating folder: %1", parentName));
            return false;
        }
        return copyFile(dest);
    }

    if(!makeDir(dest))
    {
        setStatusText(i18n("Error while creating folder: %1", dest));
        return false;
    }

    DirectoryList dirList;
    if(!listDir(&dirList, false, false))
    {
        setStatusText(i18n("Reading folder failed: %1", absoluteFilePath()));
        return false;
    }

    for(FileAccess& child: dirList)
    {
        if(!child.copyTree(dest + '/' + child.fileName()))
        {
            setStatusText(child.getStatusText());
            return false;
        }
    }
    return true;
}

// Links are recreated with the same target and never followed.
bool FileAccess::copyLink(const QString& dest)
{
    qCInfo(ddmergeFileAccess) << "copyLink(" << absoluteFilePath() << "->" << dest << ")";

    const QString parentName = QFileInfo(dest).absolutePath();
    if(!makeDir(parentName))
    {
        setStatusText(i18n("Error while creating folder: %1", parentName));
        return false;
    }

    const QFileInfo destInfo(dest);
    if((destInfo.isFile() || destInfo.isSymLink()) && !QFile::remove(dest))
    {
        setStatusText(i18n("Error: copyLink( %1 -> %2 ) failed. Deleting existing destination failed.", absoluteFilePath(), dest));
        return false;
    }

    if(!symLink(readLink(), dest))
    {
        setStatusText(i18n("Error: copyLink( %1 -> %2 ) failed.", absoluteFilePath(), dest));
        return false;
    }
    return true;
}

bool FileAccess::removeFile()
{
    setStatusText(QString());
    qCInfo(ddmergeFileAccess) << "delete(" << absoluteFilePath() << ")";

    if(!QDir().remove(absoluteFilePath()))
    {
        setStatusText(i18n("Error: delete operation failed for %1", absoluteFilePath()));
        return false;
    }
    return true;
}

bool FileAccess::removeTree()
{
    setStatusText(QString());
    if(!exists())
        return true;

    if(!isDir() || isSymLink())
        return removeFile();

    DirectoryList dirList;
    if(!listDir(&dirList, false, false))
    {
        setStatusText(i18n("Reading folder failed: %1", absoluteFilePath()));
        return false;
    }

    for(FileAccess& child: dirList)
    {
        if(!child.removeTree())
        {
            setStatusText(child.getStatusText());
            return false;
        }
    }

    qCInfo(ddmergeFileAccess) << "rmdir(" << absoluteFilePath() << ")";
    if(!removeDir(absoluteFilePath()))
    {
        setStatusText(i18n("Error: rmdir( %1 ) operation failed.", absoluteFilePath()));
        return false;
    }
    return true;
}

bool FileAccess::makeDir(const QString& dirName)
{
    if(dirName.isEmpty())
        return false;

    return QDir().mkpath(dirName);
}

bool FileAccess::removeDir(const QString& dirName)
{
    if(dirName.isEmpty())
        return false;

    return QDir().rmdir(dirName);
}

bool FileAccess::symLink(const QString& linkTarget, const QString& linkLocation)
{
    if(linkTarget.isEmpty() || linkLocation.isEmpty())
        return false;

    return QFile::link(linkTarget, linkLocation);
}

QString FileAccess::readLink() const
{
    if(!isSymLink())
        return QString();

    QString linkTarget = m_fileInfo.symLinkTarget();
#ifndef Q_OS_WIN
    // Qt5 symLinkTarget always returns an absolute path, even if the link is relative
    std::vector<char> buffer(PATH_MAX + 1);
    const ssize_t len = ::readlink(QFile::encodeName(absoluteFilePath()).constData(), buffer.data(), PATH_MAX);
    if(len > 0)
        linkTarget = QFile::decodeName(QByteArray(buffer.data(), (QtSizeType)len));
#endif
    return linkTarget;
}
