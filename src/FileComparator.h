// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef FILECOMPARATOR_H
#define FILECOMPARATOR_H

#include "TypeUtils.h"

#include <QString>

class FileAccess;
class SourceData;

class FileComparator
{
  public:
    explicit FileComparator(qint64 binaryProbeSize = defaultBinaryProbeSize): mBinaryProbeSize(binaryProbeSize) {}
    virtual ~FileComparator() = default;

    /*
        Full byte by byte comparison. bError is set when either file can not be read,
        in that case status holds the reason and the result is false.
    */
    [[nodiscard]] virtual bool identical(FileAccess& fi1, FileAccess& fi2, bool& bError, QString& status) const;

    [[nodiscard]] virtual bool isBinary(FileAccess& fi, bool& bError, QString& status) const;

    //Binary files are reported through data.isBinary(), not as a failure.
    virtual bool readAsText(FileAccess& fi, SourceData& data, QString& status) const;

    [[nodiscard]] qint64 binaryProbeSize() const { return mBinaryProbeSize; }

  private:
    qint64 mBinaryProbeSize = defaultBinaryProbeSize;
};

#endif
