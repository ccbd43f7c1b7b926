/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 David Hallas <david@davidhallas.dk>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef PATTERN_IGNORE_LIST_H
#define PATTERN_IGNORE_LIST_H

#include "DiffEntry.h"

#include <QRegularExpression>
#include <QString>

#include <optional>

/*
    Excludes entries whose relative path contains a match of a per side regular expression.
    An empty pattern excludes nothing.
*/
class PatternIgnoreList
{
  public:
    // Returns false if a pattern is not a valid expression. No pattern is changed in that case.
    bool setPatterns(const QString& leftPattern, const QString& rightPattern);

    [[nodiscard]] bool matches(const DiffEntry& entry) const;
    [[nodiscard]] bool isEmpty() const { return !m_leftPattern.has_value() && !m_rightPattern.has_value(); }

    [[nodiscard]] const QString& errorString() const { return mErrorString; }

  private:
    [[nodiscard]] static bool matches(const std::optional<QRegularExpression>& pattern, const QString& path);
    bool compile(const QString& pattern, std::optional<QRegularExpression>& expression);

    std::optional<QRegularExpression> m_leftPattern;
    std::optional<QRegularExpression> m_rightPattern;
    QString mErrorString;
};

#endif
