#include <QTest>
#include "fake_upstream_client.h"
#include "endpoint_harness.h"
#include "adapters/sources/codeforces.h"
#include "adapters/sources/gfg.h"
#include "adapters/sources/kaggle.h"
#include "adapters/sources/npm.h"
#include "adapters/sources/pypi.h"

namespace {

const QString kContestList = QStringLiteral("https://codeforces.com/api/contest.list");
const QString kPotdPage = QStringLiteral("https://www.geeksforgeeks.org/problem-of-the-day");

QJsonObject codeforcesOk(const QJsonArray& result)
{
    QJsonObject obj;
    obj["status"] = QStringLiteral("OK");
    obj["result"] = result;
    return obj;
}

}

class TestPackageAndCompetitiveSources : public QObject {
    Q_OBJECT

private slots:
    // ======================================================================
    // Codeforces
    // ======================================================================

    void testContestsFilterUpcomingBeforeCapping() {
        FakeUpstreamClient upstream;
        QJsonArray contests;
        for (int i = 1; i <= 12; ++i) {
            QJsonObject contest;
            contest["id"] = 2000 + i;
            contest["name"] = QStringLiteral("Round %1").arg(i);
            contest["phase"] = (i == 2 || i == 6 || i == 11) ? QStringLiteral("BEFORE")
                                                            : QStringLiteral("FINISHED");
            contests.append(contest);
        }
        upstream.respondJson(kContestList, codeforcesOk(contests));

        CodeforcesSource source(upstream, DefaultIdentities{});
        auto result = callEndpoint(source, QStringLiteral("/contests"));
        QVERIFY(result.has_value());

        const QJsonArray upcoming = result->toArray();
        QCOMPARE(upcoming.size(), 3);
        QCOMPARE(upcoming.at(0).toObject().value("id").toInteger(), qint64(2002));
        QCOMPARE(upcoming.at(2).toObject().value("link").toString(),
                 QStringLiteral("https://codeforces.com/contest/2011"));
        for (const QJsonValue& contest : upcoming)
            QCOMPARE(contest.toObject().value("phase").toString(), QStringLiteral("BEFORE"));
    }

    void testMyProfileRequiresHandle() {
        FakeUpstreamClient upstream;
        CodeforcesSource source(upstream, DefaultIdentities{});
        auto result = callEndpoint(source, QStringLiteral("/userinfo/me"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Configuration);
        QVERIFY(result.error().message.contains(QStringLiteral("CODEFORCES_HANDLE")));
        QCOMPARE(upstream.requestCount(), 0);
    }

    void testMyProfileUsesConfiguredHandle() {
        FakeUpstreamClient upstream;
        QJsonObject user;
        user["handle"] = QStringLiteral("tourist");
        user["rating"] = 3800;
        user["lastOnlineTimeSeconds"] = 86400;
        upstream.respondJson(QStringLiteral("https://codeforces.com/api/user.info?handles=tourist"),
                             codeforcesOk(QJsonArray{user}));

        DefaultIdentities defaults;
        defaults.codeforcesHandle = QStringLiteral("tourist");
        CodeforcesSource source(upstream, defaults);
        auto result = callEndpoint(source, QStringLiteral("/userinfo/me"));
        QVERIFY(result.has_value());
        const QJsonObject profile = result->toObject();
        QCOMPARE(profile.value("profileLink").toString(), QStringLiteral("https://codeforces.com/profile/tourist"));
        QCOMPARE(profile.value("lastOnline").toString(), QStringLiteral("1970-01-02 00:00:00"));
    }

    void testUnknownHandleIsNotFound() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral("https://codeforces.com/api/user.info?handles=ghost"), 400,
                         "{\"status\":\"FAILED\",\"comment\":\"handles: User with handle ghost not found\"}");
        upstream.respondJson(QStringLiteral("https://codeforces.com/api/user.info?handles=empty"),
                             codeforcesOk(QJsonArray{}));

        CodeforcesSource source(upstream, DefaultIdentities{});
        auto missing = callEndpoint(source, QStringLiteral("/userinfo/{handle}"),
                                    {{QStringLiteral("handle"), QStringLiteral("ghost")}});
        QVERIFY(!missing.has_value());
        QCOMPARE(missing.error().httpStatus(), 404);
        QCOMPARE(missing.error().message, QStringLiteral("Codeforces user 'ghost' not found."));

        auto empty = callEndpoint(source, QStringLiteral("/userinfo/{handle}"),
                                  {{QStringLiteral("handle"), QStringLiteral("empty")}});
        QVERIFY(!empty.has_value());
        QCOMPARE(empty.error().httpStatus(), 404);
    }

    void testCodeforcesUnreachable() {
        FakeUpstreamClient upstream;
        CodeforcesSource source(upstream, DefaultIdentities{});
        auto result = callEndpoint(source, QStringLiteral("/userinfo/{handle}"),
                                   {{QStringLiteral("handle"), QStringLiteral("tourist")}});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 503);
        QCOMPARE(result.error().message, QStringLiteral("Could not connect to the Codeforces API."));
    }

    // ======================================================================
    // PyPI / npm
    // ======================================================================

    void testPyPIPackage() {
        FakeUpstreamClient upstream;
        QJsonObject info;
        info["name"] = QStringLiteral("requests");
        info["version"] = QStringLiteral("2.32.3");
        info["summary"] = QStringLiteral("Python HTTP for Humans.");
        QJsonObject doc;
        doc["info"] = info;
        upstream.respondJson(QStringLiteral("https://pypi.org/pypi/requests/json"), doc);

        PyPISource source(upstream);
        auto package = callEndpoint(source, QStringLiteral("/{package_name}"),
                                    {{QStringLiteral("package_name"), QStringLiteral("requests")}});
        QVERIFY(package.has_value());
        QCOMPARE(package->toObject().value("version").toString(), QStringLiteral("2.32.3"));
        QVERIFY(package->toObject().value("author").isNull());

        auto latest = callEndpoint(source, QStringLiteral("/{package_name}/latest"),
                                   {{QStringLiteral("package_name"), QStringLiteral("requests")}});
        QVERIFY(latest.has_value());
        QCOMPARE(latest->toObject().value("latest_version").toString(), QStringLiteral("2.32.3"));
    }

    void testPyPIUnknownPackage() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral("https://pypi.org/pypi/no-such-pkg/json"), 404, "{\"message\":\"Not Found\"}");
        PyPISource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/{package_name}"),
                                   {{QStringLiteral("package_name"), QStringLiteral("no-such-pkg")}});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().message, QStringLiteral("Package 'no-such-pkg' not found on PyPI."));
    }

    void testPyPIMissingInfoIsParseFailure() {
        FakeUpstreamClient upstream;
        upstream.respondJson(QStringLiteral("https://pypi.org/pypi/odd/json"), QJsonObject{{"releases", 1}});
        PyPISource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/{package_name}"),
                                   {{QStringLiteral("package_name"), QStringLiteral("odd")}});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Parse);
    }

    void testNpmScopedPackageIsEncoded() {
        FakeUpstreamClient upstream;
        QJsonObject distTags;
        distTags["latest"] = QStringLiteral("7.26.0");
        QJsonObject doc;
        doc["name"] = QStringLiteral("@babel/core");
        doc["dist-tags"] = distTags;
        upstream.respondJson(QStringLiteral("https://registry.npmjs.org/%40babel%2Fcore"), doc);

        NpmSource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/{package_name}/latest"),
                                   {{QStringLiteral("package_name"), QStringLiteral("@babel/core")}});
        QVERIFY(result.has_value());
        QCOMPARE(result->toObject().value("package_name").toString(), QStringLiteral("@babel/core"));
        QCOMPARE(result->toObject().value("latest_version").toString(), QStringLiteral("7.26.0"));
    }

    void testNpmUnknownPackage() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral("https://registry.npmjs.org/nope-nope"), 404, "{\"error\":\"Not found\"}");
        NpmSource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/{package_name}"),
                                   {{QStringLiteral("package_name"), QStringLiteral("nope-nope")}});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().message, QStringLiteral("Package 'nope-nope' not found on npm."));
    }

    void testNpmSearch() {
        FakeUpstreamClient upstream;
        QJsonObject package;
        package["name"] = QStringLiteral("react");
        package["version"] = QStringLiteral("19.0.0");
        QJsonObject entry;
        entry["package"] = package;
        QJsonObject body;
        body["objects"] = QJsonArray{entry};
        upstream.respondJson(QStringLiteral("https://registry.npmjs.org/-/v1/search?text=react&size=10"), body);

        NpmSource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/search"), {}, QStringLiteral("text=react"));
        QVERIFY(result.has_value());
        QCOMPARE(result->toArray().first().toObject().value("latest_version").toString(), QStringLiteral("19.0.0"));

        auto missing = callEndpoint(source, QStringLiteral("/search"));
        QVERIFY(!missing.has_value());
        QCOMPARE(missing.error().httpStatus(), 400);
    }

    // ======================================================================
    // Kaggle
    // ======================================================================

    void testKaggleRequiresBothCredentials() {
        FakeUpstreamClient upstream;
        SourceCredentials creds;
        creds.kaggleUsername = QStringLiteral("ada");
        KaggleSource source(upstream, creds);
        auto result = callEndpoint(source, QStringLiteral("/datasets"));
        QVERIFY(!result.has_value());
        QVERIFY(result.error().message.contains(QStringLiteral("KAGGLE_KEY")));
        QCOMPARE(upstream.requestCount(), 0);
    }

    void testKaggleDatasetsUseBasicAuth() {
        FakeUpstreamClient upstream;
        QJsonObject dataset;
        dataset["title"] = QStringLiteral("Titanic");
        dataset["ref"] = QStringLiteral("heptapod/titanic");
        upstream.respondJson(QStringLiteral("https://www.kaggle.com/api/v1/datasets/list?sort_by=updated&page_size=10"),
                             QJsonArray{dataset});

        SourceCredentials creds;
        creds.kaggleUsername = QStringLiteral("ada");
        creds.kaggleKey = QStringLiteral("secret");
        KaggleSource source(upstream, creds);
        auto result = callEndpoint(source, QStringLiteral("/datasets"));
        QVERIFY(result.has_value());
        QCOMPARE(result->toArray().first().toObject().value("url").toString(),
                 QStringLiteral("https://www.kaggle.com/datasets/heptapod/titanic"));
        QCOMPARE(upstream.received().first().headers.value(QStringLiteral("Authorization")),
                 QStringLiteral("Basic ") + QString::fromLatin1(QByteArray("ada:secret").toBase64()));
    }

    // ======================================================================
    // GeeksforGeeks
    // ======================================================================

    void testGfgStats() {
        FakeUpstreamClient upstream;
        QJsonObject stats;
        stats["totalProblemsSolved"] = 321;
        stats["easy"] = 100;
        upstream.respondJson(QStringLiteral("https://geeks-for-geeks-stats-api.vercel.app/?raw=y&userName=alice"), stats);

        GeeksForGeeksSource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/stats/{username}"),
                                   {{QStringLiteral("username"), QStringLiteral("alice")}});
        QVERIFY(result.has_value());
        QCOMPARE(result->toObject().value("totalSolved").toInteger(), qint64(321));
        QVERIFY(result->toObject().value("hard").isNull());
    }

    void testPotdResolvesRelativeLink() {
        FakeUpstreamClient upstream;
        upstream.respond(kPotdPage, 200,
                         "<html><body><div class=\"POTD_header-main__abc\">"
                         "<a href=\"/problems/rotate-array/1\"><span>Rotate</span> Array</a>"
                         "</div></body></html>");

        GeeksForGeeksSource source(upstream);
        auto result = callEndpoint(source, QStringLiteral("/potd"));
        QVERIFY(result.has_value());
        QCOMPARE(result->toObject().value("title").toString(), QStringLiteral("Rotate Array"));
        QCOMPARE(result->toObject().value("link").toString(),
                 QStringLiteral("https://www.geeksforgeeks.org/problems/rotate-array/1"));
        QVERIFY(upstream.received().first().headers.value(QStringLiteral("User-Agent")).startsWith(QStringLiteral("Mozilla/5.0")));
    }

    void testPotdFailuresCollapseToParseError() {
        FakeUpstreamClient upstream;
        GeeksForGeeksSource source(upstream);

        auto unreachable = callEndpoint(source, QStringLiteral("/potd"));
        QVERIFY(!unreachable.has_value());
        QCOMPARE(unreachable.error().httpStatus(), 500);
        QCOMPARE(unreachable.error().message, QStringLiteral("Failed to fetch or parse the GFG POTD page."));

        upstream.respond(kPotdPage, 200, "<html><body><p>redesigned</p></body></html>");
        auto unparsable = callEndpoint(source, QStringLiteral("/potd"));
        QVERIFY(!unparsable.has_value());
        QCOMPARE(unparsable.error().message, QStringLiteral("Failed to fetch or parse the GFG POTD page."));
    }
};

QTEST_MAIN(TestPackageAndCompetitiveSources)
#include "tst_sources_packages_competitive.moc"
