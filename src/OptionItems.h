// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef OPTIONITEMS_H
#define OPTIONITEMS_H

#include "common.h"
#include "options.h"

#include <boost/signals2.hpp>

#include <list>

#include <QString>

/*
    One persistent setting. Every item listens to the static Options signals, so reading,
    writing and command line overrides reach all registered settings at once.
*/
class OptionItemBase
{
  public:
    explicit OptionItemBase(const QString& saveName);
    virtual ~OptionItemBase() = default;

    virtual void setToDefault() = 0;

    virtual void write(ValueMap*) const = 0;
    virtual void read(ValueMap*) = 0;

    // Remembers the stored value before a command line override replaces it.
    void preserve()
    {
        if(!m_bPreserved)
        {
            m_bPreserved = true;
            preserveImp();
        }
    }

    void unpreserve()
    {
        if(m_bPreserved)
        {
            unpreserveImp();
        }
    }

    bool accept(const QString& key, const QString& val);

    [[nodiscard]] QString getSaveName() const { return m_saveName; }
  protected:
    virtual void preserveImp() = 0;
    virtual void unpreserveImp() = 0;
    bool m_bPreserved;
    QString m_saveName;
    std::list<boost::signals2::scoped_connection> connections;
    Q_DISABLE_COPY(OptionItemBase)
};

template <class T>
class Option : public OptionItemBase
{
  public:
    Option(const T& defaultVal, const QString& saveName, T* pVar):
        OptionItemBase(saveName), m_pVar(pVar), m_defaultVal(defaultVal)
    {
    }

    void setToDefault() override { *m_pVar = m_defaultVal; }

    void write(ValueMap* config) const override { config->writeEntry(m_saveName, *m_pVar); }
    void read(ValueMap* config) override { *m_pVar = config->readEntry(m_saveName, m_defaultVal); }

  protected:
    void preserveImp() override { m_preservedVal = *m_pVar; }
    void unpreserveImp() override { *m_pVar = m_preservedVal; }
    T* m_pVar = nullptr;
    T m_preservedVal;
    T m_defaultVal;

  private:
    Q_DISABLE_COPY(Option)
};

typedef Option<bool> OptionBool;
typedef Option<qint32> OptionInt;
typedef Option<QString> OptionString;

#endif // !OPTIONITEMS_H
