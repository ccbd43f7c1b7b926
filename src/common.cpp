// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "common.h"

#include <map>
#include <utility>            // for pair

#include <QLatin1String>
#include <QStringList>

ValueMap::ValueMap() = default;

ValueMap::~ValueMap() = default;

QString ValueMap::getAsString()
{
    QString result;

    for(const auto& entry: m_map)
    {
        result += entry.first + '=' + entry.second + '\n';
    }
    return result;
}

void ValueMap::writeEntry(const QString& k, qint32 v)
{
    m_map[k].setNum(v);
}

void ValueMap::writeEntry(const QString& k, bool v)
{
    m_map[k].setNum(v);
}

void ValueMap::writeEntry(const QString& k, const QString& v)
{
    m_map[k] = v;
}

bool ValueMap::readBoolEntry(const QString& k, bool bDefault)
{
    bool b = bDefault;
    std::map<QString, QString>::const_iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        const QString s = i->second.split(',')[0].trimmed();
        b = (s == QLatin1String("1") || s.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0);
    }

    return b;
}

qint32 ValueMap::readNumEntry(const QString& k, qint32 iDefault)
{
    qint32 ival = iDefault;
    std::map<QString, QString>::const_iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        bool bOk = false;
        const qint32 parsed = i->second.split(',')[0].toInt(&bOk);
        if(bOk)
            ival = parsed;
    }

    return ival;
}

QString ValueMap::readStringEntry(const QString& k, const QString& sDefault)
{
    QString sval = sDefault;
    std::map<QString, QString>::const_iterator i = m_map.find(k);
    if(i != m_map.end())
    {
        sval = i->second;
    }

    return sval;
}

QString ValueMap::readEntry(const QString& s, const QString& defaultVal)
{
    return readStringEntry(s, defaultVal);
}
bool ValueMap::readEntry(const QString& s, bool bDefault)
{
    return readBoolEntry(s, bDefault);
}
qint32 ValueMap::readEntry(const QString& s, qint32 iDefault)
{
    return readNumEntry(s, iDefault);
}
