// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef TEXTLINES_H
#define TEXTLINES_H

#include "diff.h"
#include "TypeUtils.h"

#include <memory>

#include <QSharedPointer>
#include <QString>
#include <QStringList>

/*
    Line view of a text. Lines end at '\n', a '\r' stays part of the line. An empty text has no lines.
    A single '\n' at the end of the text terminates the last line and is remembered by hasTrailingNewline().
*/
class TextLines
{
  public:
    TextLines() = default;

    [[nodiscard]] static TextLines fromText(const QString& text);

    [[nodiscard]] inline LineCount size() const { return static_cast<LineCount>(m_v->size()); }
    [[nodiscard]] inline bool isEmpty() const { return m_v->empty(); }
    [[nodiscard]] inline bool hasTrailingNewline() const { return mHasEOLTermination; }

    [[nodiscard]] const LineDataVector& getLineData() const { return *m_v; }

    [[nodiscard]] QString line(LineType i) const;
    [[nodiscard]] QString renderedLine(LineType i) const;
    // Clamped to the available lines.
    [[nodiscard]] QStringList renderedLines(LineType first, LineCount count) const;
    [[nodiscard]] QStringList lines(LineType first, LineCount count) const;

    [[nodiscard]] const QString& toText() const { return *mBuffer; }

    [[nodiscard]] static QString join(const QStringList& lines, bool bTrailingNewline);

  private:
    QSharedPointer<QString> mBuffer = QSharedPointer<QString>::create();
    std::shared_ptr<LineDataVector> m_v = std::make_shared<LineDataVector>();
    bool mHasEOLTermination = false;
};

#endif
