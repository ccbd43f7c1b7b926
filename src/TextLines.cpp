// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "TextLines.h"

#include <algorithm>

TextLines TextLines::fromText(const QString& text)
{
    TextLines result;
    *result.mBuffer = text;

    const QString& buf = *result.mBuffer;
    const QtSizeType length = buf.length();
    QtSizeType lastOffset = 0;

    while(lastOffset < length)
    {
        QtSizeType end = buf.indexOf('\n', lastOffset);
        //The last line may not have an EOL mark.
        if(end < 0)
            end = length - 1;

        result.m_v->push_back(LineData(result.mBuffer, lastOffset, end - lastOffset + 1));
        lastOffset = end + 1;
    }

    result.mHasEOLTermination = !result.m_v->empty() && result.m_v->back().isTerminated();
    return result;
}

QString TextLines::line(LineType i) const
{
    if(i < 0 || i >= size()) return QString();
    //Detach from the shared buffer so the result outlives this object.
    return QString((*m_v)[i].getContent().constData(), (*m_v)[i].getContent().length());
}

QString TextLines::renderedLine(LineType i) const
{
    if(i < 0 || i >= size()) return QString();

    const QString raw = (*m_v)[i].getLine();
    return QString(raw.constData(), raw.length());
}

QStringList TextLines::renderedLines(LineType first, LineCount count) const
{
    QStringList result;
    const LineType begin = std::max<LineType>(first, 0);
    const LineType end = static_cast<LineType>(std::min<qint64>((qint64)first + count, size()));

    for(LineType i = begin; i < end; ++i)
        result.append(renderedLine(i));

    return result;
}

QStringList TextLines::lines(LineType first, LineCount count) const
{
    QStringList result;
    const LineType begin = std::max<LineType>(first, 0);
    const LineType end = static_cast<LineType>(std::min<qint64>((qint64)first + count, size()));

    for(LineType i = begin; i < end; ++i)
        result.append(line(i));

    return result;
}

QString TextLines::join(const QStringList& lines, bool bTrailingNewline)
{
    QString result = lines.join('\n');
    if(bTrailingNewline && !lines.isEmpty())
        result.append('\n');
    return result;
}
