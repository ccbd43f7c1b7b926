// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "FileComparator.h"

#include "compat.h"
#include "fileaccess.h"
#include "Logging.h"
#include "SourceData.h"

#include <cstring>
#include <vector>

#include <QByteArray>

bool FileComparator::identical(FileAccess& fi1, FileAccess& fi2, bool& bError, QString& status) const
{
    bool bEqual = false;

    status = "";
    bError = true;

    if(!fi1.isFile() || !fi2.isFile())
    {
        status = i18n("Unable to compare non-normal file with normal file.");
        return bEqual;
    }

    std::vector<char> buf1(maxChunkSize);
    std::vector<char> buf2(buf1.size());

    if(!fi1.open(QIODevice::ReadOnly))
    {
        status = fi1.errorString();
        return bEqual;
    }

    if(!fi2.open(QIODevice::ReadOnly))
    {
        fi1.close();
        status = fi2.errorString();
        return bEqual;
    }
    qCDebug(ddmergeFileAccess) << "Comparing files:" << fi1.absoluteFilePath() << fi2.absoluteFilePath();

    for(;;)
    {
        const qint64 len1 = fi1.read(buf1.data(), (qint64)buf1.size());
        if(len1 < 0)
        {
            status = fi1.errorString();
            fi1.close();
            fi2.close();
            return bEqual;
        }

        const qint64 len2 = fi2.read(buf2.data(), (qint64)buf2.size());
        if(len2 < 0)
        {
            status = fi2.errorString();
            fi1.close();
            fi2.close();
            return bEqual;
        }

        if(len1 != len2 || memcmp(buf1.data(), buf2.data(), len1) != 0)
        {
            bError = false;
            fi1.close();
            fi2.close();
            return bEqual;
        }

        if(len1 == 0)
            break;
    }
    fi1.close();
    fi2.close();

    // If the program really arrives here, then the files are really equal.
    bError = false;
    bEqual = true;
    return bEqual;
}

bool FileComparator::isBinary(FileAccess& fi, bool& bError, QString& status) const
{
    QByteArray prefix;

    status = "";
    bError = !fi.readPrefix(prefix, mBinaryProbeSize);
    if(bError)
    {
        status = fi.getStatusText();
        return false;
    }

    return SourceData::isBinaryData(prefix, mBinaryProbeSize);
}

bool FileComparator::readAsText(FileAccess& fi, SourceData& data, QString& status) const
{
    status = "";
    data = SourceData(mBinaryProbeSize);
    if(!data.readFile(fi))
    {
        status = data.getErrors().join('\n');
        return false;
    }

    return true;
}
