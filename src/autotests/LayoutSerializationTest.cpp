/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LayoutSerializationTest.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>

#include "layout/LayoutSerialization.h"

using namespace Termgrid;

static GridCell makeCell()
{
    Tab bound;
    bound.id = QStringLiteral("t1");
    bound.title = QStringLiteral("Terminal 1");
    bound.sessionId = QStringLiteral("pty-7");
    bound.workingDirectory = QStringLiteral("/home/me");

    Tab idle;
    idle.id = QStringLiteral("t2");
    idle.title = QStringLiteral("logs");
    idle.workingDirectory = QStringLiteral("/var/log");

    GridCell cell;
    cell.id = QStringLiteral("c1");
    cell.x = 3;
    cell.y = 6;
    cell.w = 4;
    cell.h = 5;
    cell.tabs = {bound, idle};
    return cell;
}

void LayoutSerializationTest::testSerializeEmpty()
{
    QCOMPARE(LayoutSerialization::serialize({}), QByteArray("[]"));

    const std::optional<QList<GridCell>> cells = LayoutSerialization::deserialize(QByteArray("[]"));
    QVERIFY(cells.has_value());
    QVERIFY(cells->isEmpty());
}

void LayoutSerializationTest::testSessionIdWrittenAsNull()
{
    const QByteArray blob = LayoutSerialization::serialize({makeCell()});
    const QJsonDocument document = QJsonDocument::fromJson(blob);
    QVERIFY(document.isArray());

    const QJsonObject cell = document.array().at(0).toObject();
    QCOMPARE(cell.value(QLatin1String("id")).toString(), QStringLiteral("c1"));
    QCOMPARE(cell.value(QLatin1String("w")).toInt(), 4);

    const QJsonArray tabs = cell.value(QLatin1String("tabs")).toArray();
    QCOMPARE(tabs.size(), 2);
    QCOMPARE(tabs.at(0).toObject().value(QLatin1String("sessionId")).toString(), QStringLiteral("pty-7"));
    QVERIFY(tabs.at(1).toObject().value(QLatin1String("sessionId")).isNull());
}

void LayoutSerializationTest::testRoundtrip()
{
    const QList<GridCell> cells{makeCell()};
    QString error;
    const std::optional<QList<GridCell>> parsed = LayoutSerialization::deserialize(LayoutSerialization::serialize(cells), &error);

    QVERIFY2(parsed.has_value(), qPrintable(error));
    QVERIFY(*parsed == cells);
}

void LayoutSerializationTest::testMissingTabsAccepted()
{
    const std::optional<QList<GridCell>> parsed = LayoutSerialization::deserialize(QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"h":6}])"));

    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->size(), 1);
    QVERIFY(parsed->at(0).tabs.isEmpty());
}

void LayoutSerializationTest::testRejectMalformed()
{
    QFETCH(QByteArray, blob);

    QString error;
    QVERIFY(!LayoutSerialization::deserialize(blob, &error).has_value());
    QVERIFY(!error.isEmpty());
}

void LayoutSerializationTest::testRejectMalformed_data()
{
    QTest::addColumn<QByteArray>("blob");

    QTest::newRow("not json") << QByteArray("{{{not json");
    QTest::newRow("truncated") << QByteArray(R"([{"id":"c","x":0)");
    QTest::newRow("object root") << QByteArray(R"({"id":"c"})");
    QTest::newRow("cell not object") << QByteArray(R"([42])");
    QTest::newRow("cell without id") << QByteArray(R"([{"x":0,"y":0,"w":6,"h":6,"tabs":[]}])");
    QTest::newRow("string geometry") << QByteArray(R"([{"id":"c","x":"0","y":0,"w":6,"h":6,"tabs":[]}])");
    QTest::newRow("missing height") << QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"tabs":[]}])");
    QTest::newRow("tabs not array") << QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"h":6,"tabs":{}}])");
    QTest::newRow("tab without id") << QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"h":6,"tabs":[{"title":"x"}]}])");
    QTest::newRow("duplicate cell id") << QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"h":6},{"id":"c","x":6,"y":0,"w":6,"h":6}])");
    QTest::newRow("duplicate tab id") << QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"h":6,"tabs":[{"id":"t"},{"id":"t"}]}])");
    QTest::newRow("tab id in two cells")
        << QByteArray(R"([{"id":"a","x":0,"y":0,"w":6,"h":6,"tabs":[{"id":"t"}]},{"id":"b","x":6,"y":0,"w":6,"h":6,"tabs":[{"id":"t"}]}])");
    QTest::newRow("numeric session") << QByteArray(R"([{"id":"c","x":0,"y":0,"w":6,"h":6,"tabs":[{"id":"t","sessionId":5}]}])");
}

QTEST_GUILESS_MAIN(LayoutSerializationTest)

#include "moc_LayoutSerializationTest.cpp"
