/**
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2021 Michael Reeves <reeves.87@gmail.com>
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include <QSharedPointer>
#include <QTemporaryDir>
#include <QTest>
#include <QtGlobal>

#include "../DirectoryMergeSession.h"
#include "../FileActions.h"
#include "../fileaccess.h"
#include "../options.h"
#include "DecisionSourceMoc.h"
#include "FileSystemFixture.h"

#include <memory>

// Fails the comparison of one file name.
class BrokenFileComparator: public FileComparator
{
  public:
    bool identical(FileAccess& fi1, FileAccess& fi2, bool& bError, QString& status) const override
    {
        if(fi1.fileName() == QLatin1String("broken.txt"))
        {
            bError = true;
            status = QStringLiteral("simulated read failure");
            return false;
        }
        return FileComparator::identical(fi1, fi2, bError, status);
    }
};

class DirectoryMergeSessionTest: public QObject
{
    Q_OBJECT;

  private:
    QTemporaryDir* mLeft = nullptr;
    QTemporaryDir* mRight = nullptr;
    QSharedPointer<Options> mOptions;

    class Recorder
    {
      public:
        QStringList started;
        QStringList applied;
        QStringList messages;

        void connect(DirectoryMergeSession& session)
        {
            session.entryStarted.connect([this](const DiffEntry& entry, qint32 index, qint32 total) {
                started.append(QStringLiteral("%1 %2/%3").arg(entry.path()).arg(index).arg(total));
            });
            session.hunkApplied.connect([this](const QString& path, qint32 index) { applied.append(path + ':' + QString::number(index)); });
            session.message.connect([this](const QString& text) { messages.append(text); });
        }
    };

    // mod.txt differs, only_left.txt and the folder only_right exist on one side.
    void createTrees()
    {
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "mod.txt", "a\nb\n"));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "mod.txt", "a\nB\n"));
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "only_left.txt", "left\n"));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "only_right/x.txt", "x\n"));
    }

  private Q_SLOTS:
    void init()
    {
        mLeft = new QTemporaryDir();
        mRight = new QTemporaryDir();
        QVERIFY(mLeft->isValid() && mRight->isValid());
        mOptions = QSharedPointer<Options>::create();
    }

    void cleanup()
    {
        delete mLeft;
        delete mRight;
        mLeft = mRight = nullptr;
        mOptions.reset();
    }

    void testCompare()
    {
        createTrees();

        DecisionSourceMoc decisions;
        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);

        QVERIFY(session.compare());
        const DiffEntryList expected = {
            DiffEntry::modified("mod.txt"),
            DiffEntry::leftOnly("only_left.txt", false),
            DiffEntry::rightOnly("only_right", true),
        };
        QVERIFY(session.entries() == expected);
    }

    void testRun()
    {
        createTrees();

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::choice(e_HunkChoice::Right)};
        decisions.entryScript = {EntryDecision::action(e_EntryAction::Copy), EntryDecision::action(e_EntryAction::Delete)};

        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);
        Recorder recorder;
        recorder.connect(session);

        const SessionSummary summary = session.run();

        QCOMPARE(recorder.started, (QStringList{"mod.txt 0/3", "only_left.txt 1/3", "only_right 2/3"}));
        QCOMPARE(recorder.applied, QStringList{"mod.txt:0"});
        QVERIFY(recorder.messages.isEmpty());
        QCOMPARE(decisions.askedEntries, (QStringList{"only_left.txt", "only_right"}));

        QCOMPARE(FileSystemFixture::readFile(mLeft->path(), "mod.txt"), QByteArray("a\nB\n"));
        QCOMPARE(FileSystemFixture::readFile(mRight->path(), "mod.txt"), QByteArray("a\nB\n"));
        QCOMPARE(FileSystemFixture::readFile(mRight->path(), "only_left.txt"), QByteArray("left\n"));
        QVERIFY(!FileSystemFixture::exists(mRight->path(), "only_right"));

        QCOMPARE(summary.hunksDecided, 1);
        QCOMPARE(summary.rightChoices, 1);
        QCOMPARE(summary.copies, 1);
        QCOMPARE(summary.deletes, 1);
        QCOMPARE(summary.errors, 0);
        QVERIFY(!summary.bQuit);
        QCOMPARE(summary.exitCode(), 0);
    }

    void testDryRun()
    {
        createTrees();

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::choice(e_HunkChoice::Right)};
        decisions.entryScript = {EntryDecision::action(e_EntryAction::Copy), EntryDecision::action(e_EntryAction::Delete)};

        FileActions actions(mLeft->path(), mRight->path(), true);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);

        const SessionSummary summary = session.run();
        QCOMPARE(summary.copies, 1);
        QCOMPARE(summary.deletes, 1);

        QCOMPARE(FileSystemFixture::readFile(mLeft->path(), "mod.txt"), QByteArray("a\nb\n"));
        QVERIFY(!FileSystemFixture::exists(mRight->path(), "only_left.txt"));
        QVERIFY(FileSystemFixture::exists(mRight->path(), "only_right/x.txt"));
    }

    void testQuit()
    {
        createTrees();

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::choice(e_HunkChoice::Left)};
        //No entry decisions: the first one sided entry quits.

        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);

        const SessionSummary summary = session.run();
        QVERIFY(summary.bQuit);
        QCOMPARE(summary.exitCode(), 0);
        QCOMPARE(decisions.askedEntries, QStringList{"only_left.txt"});

        //The decision made before quitting stays on disk.
        QCOMPARE(FileSystemFixture::readFile(mRight->path(), "mod.txt"), QByteArray("a\nb\n"));
        QVERIFY(FileSystemFixture::exists(mRight->path(), "only_right/x.txt"));
    }

    void testQuitInsideFile()
    {
        createTrees();

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::quit()};

        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);

        const SessionSummary summary = session.run();
        QVERIFY(summary.bQuit);
        QVERIFY(decisions.askedEntries.isEmpty());
    }

    void testExclusion()
    {
        createTrees();
        mOptions->m_excludeRegexLeft = "^only_";
        mOptions->m_excludeRegexRight = "x\\.txt$";

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::choice(e_HunkChoice::Skip)};
        decisions.entryScript = {EntryDecision::action(e_EntryAction::Skip)};

        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);

        const SessionSummary summary = session.run();
        QVERIFY(!summary.bQuit);
        //only_right does not match the right pattern, only its suppressed child would.
        QCOMPARE(decisions.askedEntries, QStringList{"only_right"});
        QCOMPARE(decisions.askedHunks, QStringList{"mod.txt:0/1"});
        QCOMPARE(session.entries().size(), (size_t)3);
    }

    void testInvalidExclusion()
    {
        createTrees();
        mOptions->m_excludeRegexRight = "(";

        DecisionSourceMoc decisions;
        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);
        Recorder recorder;
        recorder.connect(session);

        QVERIFY(!session.compare());
        QVERIFY(!session.errorString().isEmpty());

        const SessionSummary summary = session.run();
        QCOMPARE(summary.errors, 1);
        QCOMPARE(recorder.messages.size(), 1);
        QVERIFY(recorder.started.isEmpty());
    }

    void testMissingRoot()
    {
        DecisionSourceMoc decisions;
        FileActions actions(mLeft->path(), mRight->path() + "/missing", false);
        DirectoryMergeSession session(mLeft->path(), mRight->path() + "/missing", mOptions, decisions, actions);

        QVERIFY(!session.compare());
        QVERIFY(!session.errorString().isEmpty());
        QVERIFY(session.entries().empty());
    }

    void testBinaryFiles()
    {
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "image.bin", QByteArray("\x00\x01", 2)));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "image.bin", QByteArray("\x00\x02", 2)));
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "lonely.bin", QByteArray("\x00\x03", 2)));

        DecisionSourceMoc decisions;
        decisions.entryScript = {EntryDecision::action(e_EntryAction::Skip)};
        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);
        Recorder recorder;
        recorder.connect(session);

        const SessionSummary summary = session.run();
        QCOMPARE(recorder.messages.size(), 1);
        QVERIFY(decisions.askedHunks.isEmpty());
        //One sided binaries are still offered without SkipBinary.
        QCOMPARE(decisions.askedEntries, QStringList{"lonely.bin"});
        QCOMPARE(summary.skipped, 2);
    }

    void testSkipBinary()
    {
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "image.bin", QByteArray("\x00\x01", 2)));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "image.bin", QByteArray("\x00\x02", 2)));
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "lonely.bin", QByteArray("\x00\x03", 2)));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "text.txt", "plain\n"));
        mOptions->m_bSkipBinary = true;

        DecisionSourceMoc decisions;
        decisions.entryScript = {EntryDecision::action(e_EntryAction::Skip)};
        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);
        Recorder recorder;
        recorder.connect(session);

        const SessionSummary summary = session.run();
        QVERIFY(recorder.messages.isEmpty());
        QCOMPARE(recorder.started, QStringList{"text.txt 2/3"});
        QCOMPARE(decisions.askedEntries, QStringList{"text.txt"});
        QCOMPARE(summary.skipped, 3);
    }

    void testEntryErrors()
    {
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "broken.txt", "a\n"));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "broken.txt", "a\n"));
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "fine.txt", "1\n"));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "fine.txt", "2\n"));

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::choice(e_HunkChoice::Left)};
        FileActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);
        session.setFileComparator(std::make_shared<BrokenFileComparator>());
        Recorder recorder;
        recorder.connect(session);

        const SessionSummary summary = session.run();
        QCOMPARE(summary.errors, 1);
        QCOMPARE(summary.exitCode(), 2);
        QCOMPARE(session.errors().size(), 1);
        QCOMPARE(recorder.messages.size(), 1);

        //The failure does not stop the remaining entries.
        QCOMPARE(decisions.askedHunks, QStringList{"fine.txt:0/1"});
        QCOMPARE(FileSystemFixture::readFile(mRight->path(), "fine.txt"), QByteArray("1\n"));
    }

    void testWriteFailureIsReported()
    {
        QVERIFY(FileSystemFixture::createFile(mLeft->path(), "locked.txt", "1\n"));
        QVERIFY(FileSystemFixture::createFile(mRight->path(), "locked.txt", "2\n"));

        class FailingActions: public FileActions
        {
          public:
            using FileActions::FileActions;
            bool writeMerged(const QString&, const QString&, const QString&) override
            {
                setErrorString(QStringLiteral("disk full"));
                return false;
            }
        };

        DecisionSourceMoc decisions;
        decisions.hunkScript = {HunkDecision::choice(e_HunkChoice::Left)};
        FailingActions actions(mLeft->path(), mRight->path(), false);
        DirectoryMergeSession session(mLeft->path(), mRight->path(), mOptions, decisions, actions);
        Recorder recorder;
        recorder.connect(session);

        const SessionSummary summary = session.run();
        QCOMPARE(summary.errors, 1);
        QCOMPARE(summary.exitCode(), 2);
        QCOMPARE(session.errors().size(), 1);
        QCOMPARE(recorder.messages.size(), 1);
        QVERIFY(!summary.bQuit);
    }
};

QTEST_MAIN(DirectoryMergeSessionTest);

#include "DirectoryMergeSessionTest.moc"
