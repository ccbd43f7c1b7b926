// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef FILEACCESS_H
#define FILEACCESS_H

#include "DirectoryList.h"

#include <memory>
#include <type_traits>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

/*
  Defining a function as virtual in FileAccess is intended to allow testing sub classes to be written
  more easily. This way the test can use a moc class that emulates the needed conditions with no
  actual file being present.
*/
class FileAccess
{
  public:
    FileAccess();

    FileAccess(const FileAccess&);
    FileAccess(FileAccess&&) noexcept;
    FileAccess& operator=(const FileAccess&);
    FileAccess& operator=(FileAccess&&) noexcept;
    virtual ~FileAccess();
    explicit FileAccess(const QString& name);

    void setFile(const QString& name);
    void setFile(const FileAccess* pParent, const QFileInfo& fi);

    virtual void loadData();

    [[nodiscard]] bool isValid() const;
    [[nodiscard]] virtual bool isFile() const;
    [[nodiscard]] virtual bool isDir() const;
    [[nodiscard]] virtual bool isSymLink() const;
    [[nodiscard]] virtual bool exists() const;
    [[nodiscard]] virtual qint64 size() const;
    [[nodiscard]] virtual bool isExecutable() const;

    [[nodiscard]] const QString& fileName() const { return m_name; } // Just the name-part of the path, without parent directories
    [[nodiscard]] QString fileRelPath() const;                         // The path relative to base comparison directory
    [[nodiscard]] QString absoluteFilePath() const;
    [[nodiscard]] QString readLink() const; // Target of a link exactly as stored, relative targets stay relative.
    [[nodiscard]] const FileAccess* parent() const; // !=nullptr for listDir-results, but only valid if the parent was not yet destroyed.

    virtual bool readFile(QByteArray& data);
    virtual bool readPrefix(QByteArray& data, qint64 maxLength);
    virtual bool writeFile(const QByteArray& data);
    virtual bool listDir(DirectoryList* pDirList, bool bRecursive, bool bFollowDirLinks) const;
    virtual bool copyFile(const QString& dest);
    virtual bool copyTree(const QString& dest);
    virtual bool removeFile();
    virtual bool removeTree();

    static bool makeDir(const QString&);
    static bool removeDir(const QString&);
    static bool symLink(const QString& linkTarget, const QString& linkLocation);

    bool open(const QFile::OpenMode flags);
    qint64 read(char* data, const qint64 maxlen);
    void close();

    [[nodiscard]] const QString& getStatusText() const { return m_statusText; }
    [[nodiscard]] const QString& errorString() const { return getStatusText(); }

  protected:
    void setStatusText(const QString& s) { m_statusText = s; }

    void reset();
    bool copyLink(const QString& dest);

    const FileAccess* m_pParent = nullptr;
    bool m_bValidData = false;

    QDir m_baseDir;
    QFileInfo m_fileInfo;
    QString m_name;

    std::shared_ptr<QFile> realFile = nullptr;

    QString m_statusText; // Might contain an error string, when the last operation didn't succeed.
};
/*
 FileAccess objects should be copy and move assignable.
  Used in std::list<FileAccess> and std::map<QString, FileAccess>.
*/
static_assert(std::is_copy_assignable<FileAccess>::value, "FileAccess must be copy assignable.");
static_assert(std::is_move_assignable<FileAccess>::value, "FileAccess must be move assignable.");

#endif
