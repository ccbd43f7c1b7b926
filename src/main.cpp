// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2002-2011 Joachim Eibl, joachim.eibl at gmx.de
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#include "ConsoleDecisionSource.h"
#include "DirectoryMergeSession.h"
#include "Display.h"
#include "FileActions.h"
#include "Logging.h"
#include "options.h"
#include "TypeUtils.h"
#include "version.h"

#include <stdio.h> // for stdin, stdout, stderr

#include <KAboutData>
#include <KLocalizedString>
#include <KSharedConfig>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSharedPointer>
#include <QStringList>
#include <QTextStream>

void initialiseCmdLineArgs(QCommandLineParser* cmdLineParser)
{
    cmdLineParser->addOption(QCommandLineOption(u8"dry-run", i18n("Show what would be done without modifying any file.")));
    cmdLineParser->addOption(QCommandLineOption(u8"skip-binary", i18n("Skip binary files silently.")));
    cmdLineParser->addOption(QCommandLineOption(u8"exclude-regex-left", i18n("Skip entries whose path matches this regular expression on the left side."), u8"regex"));
    cmdLineParser->addOption(QCommandLineOption(u8"exclude-regex-right", i18n("Skip entries whose path matches this regular expression on the right side."), u8"regex"));
    cmdLineParser->addOption(QCommandLineOption(u8"context", i18n("Number of context lines shown around each hunk."), u8"n"));
    cmdLineParser->addOption(QCommandLineOption(u8"batch-write", i18n("Write each merged file once after its last decision instead of after every hunk.")));
    cmdLineParser->addOption(QCommandLineOption(u8"cs", i18n("Override a config setting. Use once for every setting. E.g.: --cs \"ContextLines=5\""), u8"string"));
    cmdLineParser->addOption(QCommandLineOption(u8"confighelp", i18n("Show list of config settings and current values.")));
    cmdLineParser->addOption(QCommandLineOption(u8"write-config", i18n("Write the stored settings, completed with defaults, to the config file and exit.")));

    cmdLineParser->addPositionalArgument(u8"left", i18n("Left folder"));
    cmdLineParser->addPositionalArgument(u8"right", i18n("Right folder"));
}

// Dedicated switches are applied as config overrides so they behave exactly like --cs.
QStringList collectOverrides(const QCommandLineParser& cmdLineParser)
{
    QStringList overrides = cmdLineParser.values(u8"cs");

    if(cmdLineParser.isSet(u8"dry-run"))
        overrides.append(u8"DryRun=1");
    if(cmdLineParser.isSet(u8"skip-binary"))
        overrides.append(u8"SkipBinary=1");
    if(cmdLineParser.isSet(u8"batch-write"))
        overrides.append(u8"WriteAfterEachHunk=0");
    if(cmdLineParser.isSet(u8"context"))
        overrides.append(u8"ContextLines=" + cmdLineParser.value(u8"context"));
    if(cmdLineParser.isSet(u8"exclude-regex-left"))
        overrides.append(u8"ExcludeRegexLeft=" + cmdLineParser.value(u8"exclude-regex-left"));
    if(cmdLineParser.isSet(u8"exclude-regex-right"))
        overrides.append(u8"ExcludeRegexRight=" + cmdLineParser.value(u8"exclude-regex-right"));

    return overrides;
}

qint32 main(qint32 argc, char* argv[])
{
    constexpr QLatin1String appName("ddmerge", sizeof("ddmerge") - 1);

    QCoreApplication app(argc, argv); // KAboutData and QCommandLineParser depend on this being setup.
    KLocalizedString::setApplicationDomain(appName.data());

    const QString i18nName = i18n("DDMerge");
    const QString description = i18n("Interactive comparison and merge of two folders");
    const QString copyright = i18n("(c) 2024 The DDMerge developers");

    KAboutData aboutData(appName, i18nName, QStringLiteral(DDMERGE_VERSION_STRING), description, KAboutLicense::GPL_V2, copyright);
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser cmdLineParser;
    cmdLineParser.setApplicationDescription(aboutData.shortDescription());
    aboutData.setupCommandLine(&cmdLineParser);
    initialiseCmdLineArgs(&cmdLineParser);

    cmdLineParser.process(app);
    aboutData.processCommandLine(&cmdLineParser);

    QTextStream outStream(stdout);
    QTextStream errStream(stderr);
    QTextStream inStream(stdin);

    QSharedPointer<Options> pOptions = QSharedPointer<Options>::create();
    pOptions->init();

    KSharedConfigPtr config = KSharedConfig::openConfig(QStringLiteral("ddmergerc"));
    pOptions->readOptions(config);

    if(cmdLineParser.isSet(u8"write-config"))
    {
        pOptions->saveOptions(config);
        outStream << i18n("Configuration written.") << Qt::endl;
        return 0;
    }

    const QString optionErrors = pOptions->parseOptions(collectOverrides(cmdLineParser));
    if(!optionErrors.isEmpty())
    {
        errStream << i18n("Config Option Error:") << "\n"
                  << optionErrors << Qt::flush; //newline already appended by parseOptions
        return 1;
    }

    if(cmdLineParser.isSet(u8"confighelp"))
    {
        outStream << i18n("Current Configuration:") << "\n"
                  << pOptions->calcOptionHelp() << Qt::flush;
        return 0;
    }

    const QStringList args = cmdLineParser.positionalArguments();
    if(args.size() != 2)
    {
        errStream << i18n("Exactly two folders are needed. See ddmerge --help for supported options.") << Qt::endl;
        return 1;
    }

    for(const QString& dir: args)
    {
        if(!QFileInfo(dir).isDir())
        {
            errStream << i18n("Error: %1 is not a folder.", dir) << Qt::endl;
            return 1;
        }
    }

    const QString& leftRoot = args[0];
    const QString& rightRoot = args[1];
    qCInfo(ddmergeMain) << "Comparing" << leftRoot << "with" << rightRoot;

    ConsoleDecisionSource decisions(inStream, outStream);
    FileActions actions(leftRoot, rightRoot, pOptions->dryRun());
    DirectoryMergeSession session(leftRoot, rightRoot, pOptions, decisions, actions);

    outStream << i18n("Comparing %1 with %2", leftRoot, rightRoot) << Qt::endl;
    if(pOptions->dryRun())
        outStream << i18n("Dry run: no files will be modified.") << Qt::endl;

    if(!session.compare())
    {
        errStream << i18n("Error: %1", session.errorString()) << Qt::endl;
        return 1;
    }

    if(session.entries().empty())
    {
        outStream << i18n("Directories are identical!") << Qt::endl;
        return 0;
    }

    outStream << i18n("Found %1 difference(s).", (qint32)session.entries().size()) << Qt::endl;

    session.entryStarted.connect([&outStream](const DiffEntry& entry, qint32 index, qint32 total) {
        outStream << Qt::endl
                  << Display::describeEntry(entry, index, total) << Qt::endl;
    });
    session.hunkApplied.connect([](const QString& path, qint32 index) {
        qCDebug(ddmergeMain) << "Applied hunk" << index + 1 << "of" << path;
    });
    session.message.connect([&outStream](const QString& text) {
        outStream << "  " << text << Qt::endl;
    });

    const SessionSummary summary = session.run();

    outStream << Qt::endl
              << Display::describeSummary(summary, pOptions->dryRun()) << Qt::endl;

    return summary.exitCode();
}
