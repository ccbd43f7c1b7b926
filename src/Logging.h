// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2019-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef LOGGING_H
#define LOGGING_H
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ddmergeMain);

Q_DECLARE_LOGGING_CATEGORY(ddmergeFileAccess);
Q_DECLARE_LOGGING_CATEGORY(ddmergeCore); //very noisey shows alignment and reconcile internals.
Q_DECLARE_LOGGING_CATEGORY(ddmergeDirectoryCompare);
Q_DECLARE_LOGGING_CATEGORY(ddmergeIgnoreList);

#endif // !LOGGING_H
