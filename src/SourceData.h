// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef SOURCEDATA_H
#define SOURCEDATA_H

#include "TypeUtils.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

class FileAccess;

/*
    Decoded content of one file. Binary content (a zero byte in the probed prefix) is kept as a state
    and never decoded. Text is decoded as UTF-8 with invalid sequences replaced.
*/
class SourceData
{
  public:
    explicit SourceData(qint64 binaryProbeSize = defaultBinaryProbeSize): mBinaryProbeSize(binaryProbeSize) {}

    // Returns false if the file could not be read. See getErrors().
    bool readFile(FileAccess& file);
    void setData(const QByteArray& data);
    void reset();

    [[nodiscard]] bool hasData() const { return mHasData; }
    [[nodiscard]] bool isBinary() const { return mHasData && mIsBinary; }
    [[nodiscard]] bool isText() const { return mHasData && !mIsBinary; }
    [[nodiscard]] bool isIncompleteConversion() const { return m_bIncompleteConversion; } // true if some replacement characters were needed
    [[nodiscard]] bool hasEOLTermination() const { return isText() && m_text.endsWith('\n'); }

    [[nodiscard]] const QString& getText() const { return m_text; }
    [[nodiscard]] qint64 getSizeBytes() const { return mDataSize; }
    [[nodiscard]] const QStringList& getErrors() const { return mErrors; }

    [[nodiscard]] static bool isBinaryData(const QByteArray& data, qint64 probeSize = defaultBinaryProbeSize);

  private:
    qint64 mBinaryProbeSize = defaultBinaryProbeSize;

    QString m_text;
    QStringList mErrors;
    qint64 mDataSize = 0;
    bool mHasData = false;
    bool mIsBinary = false;
    bool m_bIncompleteConversion = false;
};

#endif // !SOURCEDATA_H
