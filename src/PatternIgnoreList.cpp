/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 David Hallas <david@davidhallas.dk>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "PatternIgnoreList.h"

#include "compat.h"
#include "Logging.h"

bool PatternIgnoreList::setPatterns(const QString& leftPattern, const QString& rightPattern)
{
    std::optional<QRegularExpression> left, right;

    mErrorString.clear();
    if(!compile(leftPattern, left) || !compile(rightPattern, right))
        return false;

    m_leftPattern = left;
    m_rightPattern = right;
    return true;
}

bool PatternIgnoreList::compile(const QString& pattern, std::optional<QRegularExpression>& expression)
{
    expression.reset();
    if(pattern.isEmpty())
        return true;

    QRegularExpression candidate(pattern, QRegularExpression::UseUnicodePropertiesOption);
    if(!candidate.isValid())
    {
        qCDebug(ddmergeIgnoreList) << "Expression" << pattern << "is not valid:" << candidate.errorString();
        mErrorString = i18n("Invalid regular expression \"%1\": %2", pattern, candidate.errorString());
        return false;
    }

    qCDebug(ddmergeIgnoreList) << "Adding pattern" << pattern;
    expression = candidate;
    return true;
}

bool PatternIgnoreList::matches(const std::optional<QRegularExpression>& pattern, const QString& path)
{
    return pattern.has_value() && pattern->match(path).hasMatch();
}

bool PatternIgnoreList::matches(const DiffEntry& entry) const
{
    bool bMatch = false;
    switch(entry.kind())
    {
        case e_DiffKind::LeftOnly:
            bMatch = matches(m_leftPattern, entry.path());
            break;
        case e_DiffKind::RightOnly:
            bMatch = matches(m_rightPattern, entry.path());
            break;
        case e_DiffKind::Modified:
        case e_DiffKind::TypeMismatch:
            bMatch = matches(m_leftPattern, entry.path()) || matches(m_rightPattern, entry.path());
            break;
    }

    if(bMatch)
        qCDebug(ddmergeIgnoreList) << "Matched entry" << entry.path();
    return bMatch;
}
