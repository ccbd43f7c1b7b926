// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "SourceData.h"

#include "compat.h"
#include "fileaccess.h"
#include "Logging.h"

#include <algorithm>

#include <QTextCodec>

void SourceData::reset()
{
    m_text.clear();
    mErrors.clear();
    mDataSize = 0;
    mHasData = false;
    mIsBinary = false;
    m_bIncompleteConversion = false;
}

bool SourceData::readFile(FileAccess& file)
{
    reset();

    QByteArray data;
    if(!file.readFile(data))
    {
        mErrors.append(file.getStatusText());
        return false;
    }

    setData(data);
    return true;
}

void SourceData::setData(const QByteArray& data)
{
    reset();
    mHasData = true;
    mDataSize = data.size();
    mIsBinary = isBinaryData(data, mBinaryProbeSize);

    if(mIsBinary)
        return;

    QTextCodec* pCodec = QTextCodec::codecForName("UTF-8");
    // Keep a leading BOM as a character so the text round trips unchanged.
    QTextCodec::ConverterState state(QTextCodec::IgnoreHeader);

    m_text = pCodec->toUnicode(data.constData(), data.size(), &state);
    if(state.remainingChars > 0)
    {
        //An incomplete sequence at the end of the data is not flushed by the decoder.
        m_text.append(QChar::ReplacementCharacter);
    }

    m_bIncompleteConversion = state.invalidChars > 0 || state.remainingChars > 0;
    if(m_bIncompleteConversion)
        qCInfo(ddmergeFileAccess) << "Invalid UTF-8 sequences replaced. Invalid chars:" << state.invalidChars;
}

bool SourceData::isBinaryData(const QByteArray& data, qint64 probeSize)
{
    const qint64 checkLen = std::min<qint64>(data.size(), std::max<qint64>(probeSize, 0));

    return std::find(data.constBegin(), data.constBegin() + checkLen, '\0') != data.constBegin() + checkLen;
}
