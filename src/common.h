// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef COMMON_H
#define COMMON_H

#include <map>

#include <QString>

/*
    Flat key=value store used to move option values around. ConfigValueMap redirects the
    virtual accessors to KConfig, the base class keeps everything in memory.
*/
class ValueMap
{
  private:
    std::map<QString, QString> m_map;

  public:
    ValueMap();
    virtual ~ValueMap();

    QString getAsString();

    virtual void writeEntry(const QString&, qint32);
    virtual void writeEntry(const QString&, bool);
    virtual void writeEntry(const QString&, const QString&);

    QString     readEntry(const QString& s, const QString& defaultVal);
    bool        readEntry(const QString& s, bool bDefault);
    qint32      readEntry(const QString& s, qint32 iDefault);

  private:
    virtual bool        readBoolEntry(const QString&, bool bDefault);
    virtual qint32      readNumEntry(const QString&, qint32 iDefault);
    virtual QString     readStringEntry(const QString&, const QString&);
};

#endif
