/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef FILESYSTEMFIXTURE_H
#define FILESYSTEMFIXTURE_H

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

// Helpers for building folder trees inside a QTemporaryDir.
class FileSystemFixture
{
  public:
    static bool createFile(const QString& root, const QString& relPath, const QByteArray& content)
    {
        const QString path = root + '/' + relPath;
        if(!QDir().mkpath(QFileInfo(path).absolutePath()))
            return false;

        QFile file(path);
        if(!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
            return false;

        return file.write(content) == content.size();
    }

    static bool createDir(const QString& root, const QString& relPath)
    {
        return QDir().mkpath(root + '/' + relPath);
    }

    static QByteArray readFile(const QString& root, const QString& relPath)
    {
        QFile file(root + '/' + relPath);
        if(!file.open(QIODevice::ReadOnly))
            return QByteArray();

        return file.readAll();
    }

    static bool exists(const QString& root, const QString& relPath)
    {
        return QFileInfo::exists(root + '/' + relPath);
    }

    static bool isDir(const QString& root, const QString& relPath)
    {
        return QFileInfo(root + '/' + relPath).isDir();
    }

    // target is stored as given, so relative targets stay relative.
    static bool createLink(const QString& root, const QString& relPath, const QString& target)
    {
        const QString path = root + '/' + relPath;
        if(!QDir().mkpath(QFileInfo(path).absolutePath()))
            return false;

        return QFile::link(target, path);
    }

    static bool isSymLink(const QString& root, const QString& relPath)
    {
        return QFileInfo(root + '/' + relPath).isSymLink();
    }
};

#endif
