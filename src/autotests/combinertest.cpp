/*
 DDMerge - Directory Diff And Merge Tool

 SPDX-FileCopyrightText: 2020 Michael Reeves reeves.87@gmail.com
 SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QTest>
#include <QtGlobal>

#include "../combiners.h"

#include <boost/bind/bind.hpp>

#include <list>

class CombinertestTest: public QObject
{
    Q_OBJECT;

  private:
    bool yes() { return true; }
    bool no() { return false; }
    bool counted()
    {
        ++mCalls;
        return false;
    }

    qint32 mCalls = 0;

  private Q_SLOTS:
    void testFindCombiner()
    {
        boost::signals2::signal<bool(), find> test1;
        std::list<boost::signals2::scoped_connection> connections;

        //No slots means nothing was found.
        QVERIFY(!test1());

        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::yes, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));

        QVERIFY(test1());
        connections.clear();

        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::no, this)));

        QVERIFY(!test1());
        connections.clear();
    }

    void testFindStopsAtFirstMatch()
    {
        boost::signals2::signal<bool(), find> test1;
        std::list<boost::signals2::scoped_connection> connections;

        mCalls = 0;
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::yes, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::counted, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::counted, this)));

        QVERIFY(test1());
        QCOMPARE(mCalls, 0);

        connections.clear();
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::counted, this)));
        connections.push_back(test1.connect(boost::bind(&CombinertestTest::counted, this)));

        QVERIFY(!test1());
        QCOMPARE(mCalls, 2);
    }
};

QTEST_MAIN(CombinertestTest);

#include "combinertest.moc"
