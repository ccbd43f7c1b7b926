// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef DIFF_H
#define DIFF_H

#include "TypeUtils.h"

#include <list>
#include <vector>

#include <QDebug>
#include <QSharedPointer>
#include <QString>

class LineData;

using LineDataVector = std::vector<LineData>;

/*
    One line of a text buffer. The range includes the line's own '\n' terminator when it has one,
    so getLine() is exactly the text that line contributes to its source.
*/
class LineData
{
  private:
    QSharedPointer<QString> mBuffer;
    //This tracks the offset with-in our unicode buffer not the file offset
    QtSizeType mOffset = 0;
    QtSizeType mSize = 0;

  public:
    explicit LineData() = default; // needed for std::vector internals should not be used.
    inline LineData(const QSharedPointer<QString>& buffer, const QtSizeType inOffset, QtSizeType inSize = 0)
    {
        mBuffer = buffer;
        mOffset = inOffset;
        mSize = inSize;
    }
    [[nodiscard]] inline QtSizeType size() const { return mSize; }

    /*
        QString::fromRawData allows us to create a light weight QString backed by the buffer memmory.
    */
    [[nodiscard]] inline const QString getLine() const { return QString::fromRawData(mBuffer->data() + mOffset, mSize); }
    //Line content without the '\n' terminator. A '\r' of a CRLF ending stays part of the content.
    [[nodiscard]] inline const QString getContent() const { return QString::fromRawData(mBuffer->data() + mOffset, isTerminated() ? mSize - 1 : mSize); }
    [[nodiscard]] inline bool isTerminated() const { return mSize > 0 && mBuffer->at(mOffset + mSize - 1) == '\n'; }
    [[nodiscard]] inline const QSharedPointer<QString>& getBuffer() const { return mBuffer; }

    [[nodiscard]] inline QtSizeType getOffset() const { return mOffset; }

    [[nodiscard]] static bool equal(const LineData& l1, const LineData& l2);
};

// Each range with matching elements is followed by a range with differences on either side.
// Then again range of matching elements should follow.
class Diff
{
  private:
    LineCount nofEquals = 0;

    qint64 mDiff1 = 0;
    qint64 mDiff2 = 0;

  public:
    Diff() = default;
    Diff(LineCount eq, const qint64 inDiff1, const qint64 inDiff2)
    {
        Q_ASSERT(eq >= 0);
        nofEquals = eq;
        mDiff1 = inDiff1;
        mDiff2 = inDiff2;
    }

    [[nodiscard]] bool isEmpty() const { return nofEquals == 0 && mDiff1 == 0 && mDiff2 == 0; }

    [[nodiscard]] inline LineCount numberOfEquals() const { return nofEquals; };

    [[nodiscard]] inline qint64 diff1() const { return mDiff1; };
    [[nodiscard]] inline qint64 diff2() const { return mDiff2; };

    inline void adjustNumberOfEquals(const qint64 delta) { nofEquals += delta; }
    inline void adjustDiff1(const qint64 delta) { mDiff1 += delta; }
    inline void adjustDiff2(const qint64 delta) { mDiff2 += delta; }

    bool operator==(const Diff& b) const
    {
        return nofEquals == b.nofEquals && mDiff1 == b.mDiff1 && mDiff2 == b.mDiff2;
    };

    bool operator!=(const Diff& b) const
    {
        return !(*this == b);
    };
};

enum class e_EditOpType
{
    Equal,
    Delete,
    Insert,
    Replace
};

/*
    One unit of a line alignment. Delete carries the right side insert point as rightStart with
    rightCount == 0, Insert carries the left side anchor as leftStart with leftCount == 0.
*/
class EditOp
{
  private:
    e_EditOpType mType = e_EditOpType::Equal;
    LineType mLeftStart = 0;
    LineCount mLeftCount = 0;
    LineType mRightStart = 0;
    LineCount mRightCount = 0;

  public:
    EditOp() = default;
    EditOp(e_EditOpType type, LineType leftStart, LineCount leftCount, LineType rightStart, LineCount rightCount):
        mType(type), mLeftStart(leftStart), mLeftCount(leftCount), mRightStart(rightStart), mRightCount(rightCount)
    {
    }

    [[nodiscard]] inline e_EditOpType type() const { return mType; }
    [[nodiscard]] inline bool isChange() const { return mType != e_EditOpType::Equal; }

    [[nodiscard]] inline LineType leftStart() const { return mLeftStart; }
    [[nodiscard]] inline LineCount leftCount() const { return mLeftCount; }
    [[nodiscard]] inline LineType rightStart() const { return mRightStart; }
    [[nodiscard]] inline LineCount rightCount() const { return mRightCount; }

    bool operator==(const EditOp& b) const
    {
        return mType == b.mType && mLeftStart == b.mLeftStart && mLeftCount == b.mLeftCount &&
               mRightStart == b.mRightStart && mRightCount == b.mRightCount;
    }
    bool operator!=(const EditOp& b) const { return !(*this == b); }
};

using EditOpList = std::vector<EditOp>;

class DiffList: public std::list<Diff>
{
  public:
    using std::list<Diff>::list;
    void verify(const LineCount size1, const LineCount size2) const;
    [[nodiscard]] EditOpList toEditOps() const;
};

QDebug operator<<(QDebug debug, const EditOp& op);

#endif
