// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef OPTIONS_H
#define OPTIONS_H

#include "combiners.h"
#include "TypeUtils.h"

#include <boost/signals2.hpp>
#include <list>
#include <memory>

#include <QString>
#include <QStringList>

#include <KSharedConfig>

class ValueMap;

class OptionItemBase;

constexpr char DDMERGE_CONFIG_GROUP[] = "DDMerge Options";

class Options
{
  public:
    static boost::signals2::signal<void()> resetToDefaults;
    static boost::signals2::signal<void(ValueMap*)> read;
    static boost::signals2::signal<void(ValueMap*)> write;

    static boost::signals2::signal<void()> unpreserve;
    static boost::signals2::signal<bool(const QString&, const QString&), find> accept;

    void init();

    void readOptions(const KSharedConfigPtr config);
    void saveOptions(const KSharedConfigPtr config);

    const QString parseOptions(const QStringList& optionList);
    [[nodiscard]] QString calcOptionHelp();

    [[nodiscard]] qint32 contextLines() const { return m_contextLines; }
    [[nodiscard]] qint64 binaryProbeSize() const { return m_binaryProbeSize; }
    [[nodiscard]] bool skipBinary() const { return m_bSkipBinary; }
    [[nodiscard]] bool dryRun() const { return m_bDryRun; }
    [[nodiscard]] bool writeAfterEachHunk() const { return m_bWriteAfterEachHunk; }
    [[nodiscard]] const QString& excludeRegexLeft() const { return m_excludeRegexLeft; }
    [[nodiscard]] const QString& excludeRegexRight() const { return m_excludeRegexRight; }

  private:
    void addOptionItem(std::shared_ptr<OptionItemBase> inItem);
    void sanitize();

    std::list<std::shared_ptr<OptionItemBase>> mOptionItemList;

  public:
    qint32 m_contextLines = defaultContextLines;
    qint32 m_binaryProbeSize = defaultBinaryProbeSize;
    bool m_bSkipBinary = false;
    bool m_bDryRun = false;
    /*
        Rewrite both files after every decisive hunk choice so that every intermediate state on
        disk is complete. Turning this off batches a single write per file.
    */
    bool m_bWriteAfterEachHunk = true;
    QString m_excludeRegexLeft;
    QString m_excludeRegexRight;
};

#endif
