// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2019-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "options.h"

#include "combiners.h"
#include "ConfigValueMap.h"
#include "Logging.h"
#include "OptionItems.h"

#include <boost/bind/bind.hpp>
#include <boost/signals2.hpp>
#include <memory>

#include <KSharedConfig>

boost::signals2::signal<void ()> Options::resetToDefaults;
boost::signals2::signal<void (ValueMap*)> Options::read;
boost::signals2::signal<void (ValueMap*)> Options::write;

boost::signals2::signal<void ()> Options::unpreserve;

boost::signals2::signal<bool (const QString&, const QString&), find> Options::accept;

OptionItemBase::OptionItemBase(const QString& saveName)
{
    m_saveName = saveName;
    m_bPreserved = false;

    connections.push_back(Options::resetToDefaults.connect(boost::bind(&OptionItemBase::setToDefault, this)));

    connections.push_back(Options::read.connect(boost::bind(&OptionItemBase::read, this, boost::placeholders::_1)));
    connections.push_back(Options::write.connect(boost::bind(&OptionItemBase::write, this, boost::placeholders::_1)));

    connections.push_back(Options::unpreserve.connect(boost::bind(&OptionItemBase::unpreserve, this)));

    connections.push_back(Options::accept.connect(boost::bind(&OptionItemBase::accept, this, boost::placeholders::_1, boost::placeholders::_2)));
}

bool OptionItemBase::accept(const QString& key, const QString& val)
{
    if(getSaveName() != key)
        return false;

    preserve();

    ValueMap config;
    config.writeEntry(key, val); // Write the value as a string and
    read(&config);               // use the internal conversion from string to the needed value.

    return true;
}

void Options::init()
{
    addOptionItem(std::make_shared<OptionInt>(defaultContextLines, "ContextLines", &m_contextLines));
    addOptionItem(std::make_shared<OptionInt>((qint32)defaultBinaryProbeSize, "BinaryProbeSize", &m_binaryProbeSize));
    addOptionItem(std::make_shared<OptionBool>(false, "SkipBinary", &m_bSkipBinary));
    addOptionItem(std::make_shared<OptionBool>(false, "DryRun", &m_bDryRun));
    addOptionItem(std::make_shared<OptionBool>(true, "WriteAfterEachHunk", &m_bWriteAfterEachHunk));
    addOptionItem(std::make_shared<OptionString>(QString(), "ExcludeRegexLeft", &m_excludeRegexLeft));
    addOptionItem(std::make_shared<OptionString>(QString(), "ExcludeRegexRight", &m_excludeRegexRight));
}

void Options::saveOptions(const KSharedConfigPtr config)
{
    // No i18n()-Translations here!

    ConfigValueMap cvm(config->group(DDMERGE_CONFIG_GROUP));

    // Values overridden from the command line are not persisted.
    unpreserve();
    write(&cvm);
    config->sync();
}

void Options::readOptions(const KSharedConfigPtr config)
{
    // No i18n()-Translations here!

    ConfigValueMap cvm(config->group(DDMERGE_CONFIG_GROUP));

    read(&cvm);
    sanitize();
}

void Options::sanitize()
{
    if(m_contextLines < 0)
    {
        qCWarning(ddmergeMain) << "Negative ContextLines" << m_contextLines << "replaced by default.";
        m_contextLines = defaultContextLines;
    }

    if(m_binaryProbeSize <= 0)
    {
        qCWarning(ddmergeMain) << "Invalid BinaryProbeSize" << m_binaryProbeSize << "replaced by default.";
        m_binaryProbeSize = defaultBinaryProbeSize;
    }
}

const QString Options::parseOptions(const QStringList& optionList)
{
    QString result;

    for(const QString& optionString: optionList)
    {
        const QtSizeType pos = optionString.indexOf('=');
        if(pos > 0) // seems not to have a tag
        {
            const QString key = optionString.left(pos);
            const QString val = optionString.mid(pos + 1);

            bool bFound = accept(key, val);

            if(!bFound)
            {
                result += "No config item named \"" + key + "\"\n";
            }
        }
        else
        {
            result += "No '=' found in \"" + optionString + "\"\n";
        }
    }

    sanitize();
    return result;
}

QString Options::calcOptionHelp()
{
    ValueMap config;

    write(&config);

    return config.getAsString();
}

void Options::addOptionItem(std::shared_ptr<OptionItemBase> inItem)
{
    mOptionItemList.push_back(inItem);
}
