// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef CONFIGVALUEMAP_H
#define CONFIGVALUEMAP_H

#include "common.h"

#include <KConfigGroup>
#include <QString>

// Stores option values in the "DDMerge Options" group of ddmergerc instead of memory.
class ConfigValueMap : public ValueMap
{
  private:
    KConfigGroup m_group;

  public:
    explicit ConfigValueMap(const KConfigGroup& group) : m_group(group) {}

    void writeEntry(const QString& key, qint32 value) override { m_group.writeEntry(key, value); }
    void writeEntry(const QString& key, bool bValue) override { m_group.writeEntry(key, bValue); }
    void writeEntry(const QString& key, const QString& value) override { m_group.writeEntry(key, value); }

  private:
    bool readBoolEntry(const QString& key, bool bDefault) override { return m_group.readEntry(key, bDefault); }
    qint32 readNumEntry(const QString& key, qint32 iDefault) override { return m_group.readEntry(key, iDefault); }
    QString readStringEntry(const QString& key, const QString& defaultValue) override { return m_group.readEntry(key, defaultValue); }
};

#endif // !CONFIGVALUEMAP_H
