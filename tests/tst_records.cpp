#include <QTest>
#include <QJsonArray>
#include "model/code_hosting.h"
#include "model/competitive.h"
#include "model/news.h"
#include "model/packages.h"
#include "model/questions.h"
#include "model/json_fields.h"

class TestRecords : public QObject {
    Q_OBJECT

private slots:
    void testContestLinkIsSynthesized() {
        QJsonObject obj;
        obj["id"] = 1900;
        obj["name"] = QStringLiteral("Codeforces Round 900");
        obj["phase"] = QStringLiteral("BEFORE");
        auto contest = Contest::fromCodeforces(obj);
        QVERIFY(contest.has_value());
        QCOMPARE(contest->link, QStringLiteral("https://codeforces.com/contest/1900"));
        QCOMPARE(contest->toJson().value("id").toInteger(), qint64(1900));
    }

    void testAnswerLinkIsSynthesized() {
        QJsonObject obj;
        obj["answer_id"] = 42;
        obj["question_id"] = 7;
        auto answer = Answer::fromStackExchange(obj);
        QVERIFY(answer.has_value());
        QCOMPARE(answer->link, QStringLiteral("https://stackoverflow.com/a/42"));
    }

    void testMissingRequiredFieldIsParseFailure() {
        QJsonObject obj;
        obj["id"] = 1;
        obj["name"] = QStringLiteral("repo");
        auto repo = Repository::fromGitHub(obj);
        QVERIFY(!repo.has_value());
        QCOMPARE(repo.error().kind, ErrorKind::Parse);
        QVERIFY(repo.error().message.contains(QStringLiteral("html_url")));
        QCOMPARE(repo.error().httpStatus(), 500);
    }

    void testPullRequestTakesUserLogin() {
        QJsonObject user;
        user["login"] = QStringLiteral("octocat");
        QJsonObject obj;
        obj["id"] = 5;
        obj["title"] = QStringLiteral("Fix it");
        obj["html_url"] = QStringLiteral("https://github.com/o/r/pull/5");
        obj["user"] = user;
        auto pr = PullRequest::fromGitHub(obj);
        QVERIFY(pr.has_value());
        QCOMPARE(pr->toJson().value("user").toString(), QStringLiteral("octocat"));
    }

    void testReleaseDefaults() {
        const Release release = Release::fromGitHub(QJsonObject());
        QCOMPARE(release.tagName, QStringLiteral("No Tag"));
        QVERIFY(!release.name.has_value());
        QVERIFY(release.toJson().value("name").isNull());
    }

    void testHackerNewsStoryDefaults() {
        QJsonObject obj;
        obj["id"] = 8863;
        obj["title"] = QStringLiteral("My YC app");
        const auto story = Story::fromHackerNewsItem(obj);
        QVERIFY(story.has_value());
        QCOMPARE(story->author, QStringLiteral("N/A"));
        QCOMPARE(story->type, QStringLiteral("N/A"));
        QCOMPARE(story->points, qint64(0));
        QVERIFY(story->toJson().value("url").isNull());

        QJsonObject untitled;
        untitled["id"] = 1;
        QVERIFY(!Story::fromHackerNewsItem(untitled).has_value());
    }

    void testAlgoliaHitParsesStringId() {
        QJsonObject obj;
        obj["objectID"] = QStringLiteral("123");
        obj["title"] = QStringLiteral("Show HN");
        obj["points"] = 10;
        const auto story = Story::fromAlgoliaHit(obj);
        QVERIFY(story.has_value());
        QCOMPARE(story->id, qint64(123));
        QCOMPARE(story->author, QStringLiteral("No Author"));
        QCOMPARE(story->type, QStringLiteral("story"));
    }

    void testRedditPostUrlAndFallbacks() {
        QJsonObject data;
        data["id"] = QStringLiteral("abc");
        data["permalink"] = QStringLiteral("/r/cpp/comments/abc/x/");
        auto post = Post::fromReddit(data, QStringLiteral("cpp"));
        QVERIFY(post.has_value());
        QCOMPARE(post->url, QStringLiteral("https://www.reddit.com/r/cpp/comments/abc/x/"));
        QCOMPARE(post->title, QStringLiteral("No Title"));
        QCOMPARE(post->subreddit, QStringLiteral("cpp"));
    }

    void testDevToTagsFromArrayOrString() {
        QJsonObject listItem;
        listItem["id"] = 1;
        listItem["tag_list"] = QJsonArray{QStringLiteral("cpp"), QStringLiteral("qt")};
        auto fromList = Article::fromDevTo(listItem);
        QVERIFY(fromList.has_value());
        QCOMPARE(fromList->tags, QStringLiteral("cpp, qt"));
        QVERIFY(!fromList->author.has_value());

        QJsonObject single;
        single["id"] = 2;
        single["tag_list"] = QStringLiteral("rust, go");
        QJsonObject user;
        user["name"] = QStringLiteral("Ada");
        single["user"] = user;
        auto fromString = Article::fromDevTo(single);
        QVERIFY(fromString.has_value());
        QCOMPARE(fromString->tags, QStringLiteral("rust, go"));
        QCOMPARE(fromString->author.value_or(QString()), QStringLiteral("Ada"));
    }

    void testPackageDefaults() {
        const PackageInfo info = PackageInfo::fromPyPI(QJsonObject());
        QCOMPARE(info.name, QStringLiteral("No Name"));
        QCOMPARE(info.version, QStringLiteral("0.0.0"));
        QVERIFY(info.toJson().value("home_page").isNull());

        const NpmPackage npm = NpmPackage::fromRegistry(QJsonObject(), QStringLiteral("left-pad"));
        QCOMPARE(npm.name, QStringLiteral("left-pad"));
        QCOMPARE(LatestVersion::fromNpm(npm).latestVersion, QStringLiteral("0.0.0"));
    }

    void testFormatEpoch() {
        QVERIFY(!UserProfile::formatEpoch(std::nullopt).has_value());
        QVERIFY(!UserProfile::formatEpoch(0).has_value());
        QCOMPARE(UserProfile::formatEpoch(qint64(86400)).value_or(QString()),
                 QStringLiteral("1970-01-02 00:00:00"));
    }

    void testUserProfileNullsAbsentFields() {
        QJsonObject obj;
        obj["handle"] = QStringLiteral("tourist");
        obj["rating"] = 3800;
        obj["lastOnlineTimeSeconds"] = 0;
        auto profile = UserProfile::fromCodeforces(obj);
        QVERIFY(profile.has_value());
        const QJsonObject json = profile->toJson();
        QCOMPARE(json.value("rating").toInteger(), qint64(3800));
        QVERIFY(json.value("country").isNull());
        QVERIFY(json.value("lastOnline").isNull());
        QCOMPARE(json.value("profileLink").toString(), QStringLiteral("https://codeforces.com/profile/tourist"));
    }

    void testSearchQuestionCarriesDetails() {
        QJsonObject owner;
        owner["display_name"] = QStringLiteral("Jon");
        QJsonObject obj;
        obj["question_id"] = 11;
        obj["title"] = QStringLiteral("How?");
        obj["link"] = QStringLiteral("https://stackoverflow.com/q/11");
        obj["owner"] = owner;
        obj["tags"] = QJsonArray{QStringLiteral("c++")};
        obj["is_answered"] = true;

        auto plain = Question::fromStackExchange(obj);
        QVERIFY(plain.has_value());
        QVERIFY(!plain->toJson().contains("owner"));

        auto search = Question::fromStackExchangeSearch(obj);
        QVERIFY(search.has_value());
        const QJsonObject json = search->toJson();
        QCOMPARE(json.value("owner").toObject().value("display_name").toString(), QStringLiteral("Jon"));
        QCOMPARE(json.value("tags").toArray().size(), 1);
        QVERIFY(json.value("is_answered").toBool());
    }

    void testMapObjectsCapsAndFailsOnFirstBadElement() {
        QJsonArray array;
        for (int i = 1; i <= 5; ++i) {
            QJsonObject obj;
            obj["question_id"] = i;
            obj["title"] = QStringLiteral("q%1").arg(i);
            obj["link"] = QStringLiteral("l%1").arg(i);
            array.append(obj);
        }
        auto capped = json_fields::mapObjects<Question>(array, &Question::fromStackExchange, 3);
        QVERIFY(capped.has_value());
        QCOMPARE(capped->size(), 3);
        QCOMPARE(capped->last().questionId, qint64(3));

        array.append(QJsonObject());
        auto failed = json_fields::mapObjects<Question>(array, &Question::fromStackExchange);
        QVERIFY(!failed.has_value());
        QCOMPARE(failed.error().kind, ErrorKind::Parse);
    }

    void testNumericStringFieldsKeepFractions() {
        const QJsonObject obj{{"fraction", 1.5}, {"whole", 42}, {"large", 1000000}, {"text", "v2"}};
        QCOMPARE(json_fields::optionalString(obj, "fraction").value_or(QString()), QStringLiteral("1.5"));
        QCOMPARE(json_fields::optionalString(obj, "whole").value_or(QString()), QStringLiteral("42"));
        QCOMPARE(json_fields::optionalString(obj, "large").value_or(QString()), QStringLiteral("1000000"));
        QCOMPARE(json_fields::stringOr(obj, "text", QString()), QStringLiteral("v2"));
        QVERIFY(!json_fields::optionalString(obj, "missing").has_value());
    }
};

QTEST_MAIN(TestRecords)
#include "tst_records.moc"
