// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2019-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "Logging.h"

#ifdef NDEBUG
#define logLevel        QtWarningMsg

#else
#define logLevel         QtInfoMsg
#endif

Q_LOGGING_CATEGORY(ddmergeMain, "org.ddmerge", logLevel)
Q_LOGGING_CATEGORY(ddmergeFileAccess, "org.ddmerge.fileAccess", logLevel)
//ddmergeCore prints every edit operation and hunk decision. Only useful when working on the core itself.
Q_LOGGING_CATEGORY(ddmergeCore, "org.ddmerge.core", QtWarningMsg)
Q_LOGGING_CATEGORY(ddmergeDirectoryCompare, "org.ddmerge.directoryCompare", logLevel)
Q_LOGGING_CATEGORY(ddmergeIgnoreList, "org.ddmerge.ignoreList", logLevel)

#undef logLevel
