#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest>
#include "song/GenerationCache.hpp"

using namespace st;
using namespace st::song;

namespace {

GenerationCache sampleCache() {
    GenerationCache cache;
    cache.addTracks(Stage::Base, {TokenSeq{1, 2, 3}, TokenSeq{4, 5, 6}});
    cache.addTracks(Stage::Refine, {TokenSeq(24, 7), TokenSeq(24, 8)});
    cache.addSegment("verse", 0, 2);
    cache.addSegment("chorus", 2, 3);
    return cache;
}

} // namespace

class TestCacheSnapshot : public QObject {
    Q_OBJECT

private slots:
    void testSaveLayout() {
        auto data = sampleCache().save();

        QVERIFY(data.value("tracks").isArray());
        const auto stages = data.value("tracks").toArray();
        QCOMPARE(stages.size(), qsizetype(2));
        QCOMPARE(stages[0].toArray().size(), qsizetype(2));
        QCOMPARE(stages[0].toArray()[1].toArray()[2].toInteger(), qint64(6));

        const auto segments = data.value("segments").toArray();
        QCOMPARE(segments.size(), qsizetype(2));
        QCOMPARE(segments[1].toArray()[0].toString(), QString("chorus"));
        QCOMPARE(segments[1].toArray()[1].toInteger(), qint64(2));
        QCOMPARE(segments[1].toArray()[2].toInteger(), qint64(3));
    }

    void testLoadRestoresSavedState() {
        auto source = sampleCache();
        auto data = source.save();

        // Through text, as a persistence layer would
        auto reparsed = QJsonDocument::fromJson(QJsonDocument(data).toJson()).object();

        GenerationCache restored;
        auto result = restored.load(reparsed);

        QVERIFY(result.isOk());
        QVERIFY(restored.segments() == source.segments());
        for (auto stage : allStages()) {
            for (auto t : allTracks()) {
                QVERIFY(restored.track(stage, t) == source.track(stage, t));
            }
        }
    }

    void testSaveIsDeepCopy() {
        auto cache = sampleCache();
        auto data = cache.save();

        cache.track(Stage::Base, Track::Vocal).push_back(99);
        cache.rewind(1000);

        QCOMPARE(data.value("tracks").toArray()[0].toArray()[0].toArray().size(),
                 qsizetype(3));
        QCOMPARE(data.value("segments").toArray().size(), qsizetype(2));
    }

    void testMissingKeysKeepCurrentState() {
        auto cache = sampleCache();
        QJsonObject partial;
        partial.insert("segments", QJsonArray{QJsonArray{"intro", 0, 1}});

        auto result = cache.load(partial);

        QVERIFY(result.isOk());
        QCOMPARE(cache.segments().size(), size_t(1));
        QCOMPARE(cache.segments()[0].name, std::string("intro"));
        QVERIFY(cache.track(Stage::Base, Track::Vocal) == TokenSeq({1, 2, 3}));

        QVERIFY(cache.load(QJsonObject{}).isOk());
        QCOMPARE(cache.segments().size(), size_t(1));
    }

    void testShortTrackListLeavesEmptyBuffers() {
        auto cache = sampleCache();
        QJsonObject data;
        data.insert("tracks", QJsonArray{QJsonArray{QJsonArray{9, 9}}});

        QVERIFY(cache.load(data).isOk());

        QVERIFY(cache.track(Stage::Base, Track::Vocal) == TokenSeq({9, 9}));
        QVERIFY(cache.track(Stage::Base, Track::Instrumental).empty());
        QVERIFY(cache.track(Stage::Refine, Track::Vocal).empty());
    }

    void testMalformedSnapshotIsRejected() {
        auto cache = sampleCache();

        QJsonObject badTokens;
        badTokens.insert("tracks", QJsonArray{QJsonArray{QJsonArray{1, "x"}}});
        QVERIFY(cache.load(badTokens).isErr());

        QJsonObject badSegment;
        badSegment.insert("segments", QJsonArray{QJsonArray{"verse", -1, 2}});
        QVERIFY(cache.load(badSegment).isErr());

        QJsonObject wrongShape;
        wrongShape.insert("segments", QJsonArray{QJsonArray{"verse", 0}});
        wrongShape.insert("tracks", QJsonArray{});
        auto result = cache.load(wrongShape);
        QVERIFY(result.isErr());
        QVERIFY(!result.error().message.empty());

        // Nothing installed by the failed loads
        QCOMPARE(cache.segments().size(), size_t(2));
        QVERIFY(cache.track(Stage::Base, Track::Vocal) == TokenSeq({1, 2, 3}));
    }
};

int runTestCacheSnapshot(int argc, char** argv) {
    TestCacheSnapshot tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_CacheSnapshot.moc"
