// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on
#ifndef TYPEUTILS_H
#define TYPEUTILS_H

#include <QtGlobal>

#include <boost/safe_numerics/automatic.hpp>
#include <boost/safe_numerics/safe_integer.hpp>

using LineType = qint32;
using LineCount = qint32;

using DDMerge_exception_policy = boost::safe_numerics::exception_policy<
    boost::safe_numerics::throw_exception, // arithmetic error
    boost::safe_numerics::trap_exception,  // implementation defined behavior
    boost::safe_numerics::trap_exception,  // undefined behavior
    boost::safe_numerics::trap_exception   // uninitialized value
>;

template <typename T>
using SafeInt = boost::safe_numerics::safe<T, boost::safe_numerics::automatic, DDMerge_exception_policy>;

//Number of leading bytes inspected when deciding if a file is binary.
constexpr static qint64 defaultBinaryProbeSize = 8192;
constexpr static qint32 defaultContextLines = 3;
//Read and write chunk size used by FileAccess and FileComparator.
constexpr static qint64 maxChunkSize = 100000;

#endif
