#include <QtTest>
#include "song/SegmentMerge.hpp"
#include "song/Song.hpp"

using namespace st;
using namespace st::song;

namespace {

// Segment i gets base vocal tokens {100 * (i + 1)}
void tagTokens(Song& song) {
    for (usize i = 0; i < song.size(); ++i) {
        song[i].setTrack(Stage::Base, Track::Vocal, {static_cast<Token>(100 * (i + 1))});
    }
}

Token firstToken(const Song& song, usize index) {
    const auto& tokens = song[index].track(Stage::Base, Track::Vocal);
    return tokens.empty() ? -1 : tokens.front();
}

} // namespace

class TestSegmentMerge : public QObject {
    Q_OBJECT

private slots:
    void testStrategyNames() {
        QVERIFY(mergeStrategyFromString("identity") == MergeStrategy::Identity);
        QVERIFY(mergeStrategyFromString("positional") == MergeStrategy::Positional);
        QVERIFY(!mergeStrategyFromString("fuzzy").has_value());
        QCOMPARE(std::string(mergeStrategyName(MergeStrategy::Positional)),
                 std::string("positional"));
    }

    void testInsertedSectionKeepsFollowingTokens() {
        Song song;
        song.setLyrics("[intro]\na\n[verse]\nb\n[chorus]\nc");
        tagTokens(song);

        auto report = song.setLyrics("[intro]\na\n[bridge]\nnew\n[verse]\nb\n[chorus]\nc");

        QCOMPARE(song.size(), size_t(4));
        QCOMPARE(firstToken(song, 0), Token{100});
        QCOMPARE(firstToken(song, 1), Token{-1});
        QCOMPARE(firstToken(song, 2), Token{200});
        QCOMPARE(firstToken(song, 3), Token{300});
        QVERIFY(report.entries[1].kind == MatchKind::None);
        QVERIFY(report.entries[2].kind == MatchKind::Name);
        QCOMPARE(report.merged(), size_t(3));
    }

    void testRemovedSectionKeepsFollowingTokens() {
        Song song;
        song.setLyrics("[intro]\na\n[verse]\nb\n[chorus]\nc");
        tagTokens(song);

        song.setLyrics("[intro]\na\n[chorus]\nc");

        QCOMPARE(firstToken(song, 0), Token{100});
        QCOMPARE(firstToken(song, 1), Token{300});
    }

    void testPositionalStrategyMisalignsOnInsert() {
        Song song;
        song.setMergeStrategy(MergeStrategy::Positional);
        song.setLyrics("[intro]\na\n[verse]\nb");
        tagTokens(song);

        song.setLyrics("[intro]\na\n[bridge]\nnew\n[verse]\nb");

        QCOMPARE(firstToken(song, 1), Token{200});
        QCOMPARE(firstToken(song, 2), Token{-1});
    }

    void testEditedLyricsStillMerge() {
        Song song;
        song.setLyrics("[verse]\nold words\n[chorus]\nhook");
        tagTokens(song);

        auto report = song.setLyrics("[verse]\nnew words\n[chorus]\nhook");

        QCOMPARE(firstToken(song, 0), Token{100});
        QVERIFY(report.entries[0].contentChanged);
        QVERIFY(!report.entries[1].contentChanged);
    }

    void testInPlaceRenameFallsBackToPosition() {
        Song song;
        song.setLyrics("[verse]\na\n[chorus]\nb");
        tagTokens(song);

        auto report = song.setLyrics("[verse1]\na\n[chorus]\nb");

        QCOMPARE(firstToken(song, 0), Token{100});
        QVERIFY(report.entries[0].kind == MatchKind::Positional);
        QVERIFY(report.entries[1].kind == MatchKind::Name);
    }

    void testIdTagsFollowMovedSections() {
        Song song;
        song.setLyrics("#id A\n[verse]\na\n#id B\n[verse]\nb");
        tagTokens(song);

        auto report = song.setLyrics("#id B\n[verse]\nb\n#id A\n[verse]\na");

        QCOMPARE(firstToken(song, 0), Token{200});
        QCOMPARE(firstToken(song, 1), Token{100});
        QVERIFY(report.entries[0].kind == MatchKind::Id);
        QVERIFY(report.entries[1].kind == MatchKind::Id);
    }

    void testDuplicateIdFallsBackToNames() {
        Song song;
        song.setLyrics("#id A\n[verse]\na\n#id A\n[chorus]\nb");
        tagTokens(song);

        auto report = song.setLyrics("#id A\n[chorus]\nb");

        QCOMPARE(report.ambiguous(), size_t(0));
        QVERIFY(report.entries[0].kind == MatchKind::Name);
        QCOMPARE(firstToken(song, 0), Token{200});
    }

    void testIdRepeatedInNewListIsNotAKey() {
        Song song;
        song.setLyrics("#id A\n[verse]\na\n[chorus]\nb");
        tagTokens(song);

        auto report = song.setLyrics("#id A\n[chorus]\nb\n#id A\n[verse]\na");

        // Neither new segment may claim the old verse through the id alone
        QVERIFY(report.entries[0].kind != MatchKind::Id);
        QVERIFY(report.entries[1].kind != MatchKind::Id);
        QCOMPARE(firstToken(song, 0), Token{200});
    }

    void testRenameWithAppendedSectionKeepsTokens() {
        Song song;
        song.setLyrics("[intro]\na\n[verse]\nb");
        tagTokens(song);

        auto report = song.setLyrics("[Intro]\na\n[verse]\nb\n[outro]\nc");

        QCOMPARE(firstToken(song, 0), Token{100});
        QCOMPARE(firstToken(song, 1), Token{200});
        QCOMPARE(firstToken(song, 2), Token{-1});
        QVERIFY(report.entries[0].kind == MatchKind::Positional);
        QVERIFY(report.entries[2].kind == MatchKind::None);
    }

    void testRenameWithRemovedSectionKeepsTokens() {
        Song song;
        song.setLyrics("[intro]\na\n[verse]\nb\n[outro]\nc");
        tagTokens(song);

        song.setLyrics("[opening]\na\n[verse]\nb");

        QCOMPARE(song.size(), size_t(2));
        QCOMPARE(firstToken(song, 0), Token{100});
        QCOMPARE(firstToken(song, 1), Token{200});
    }

    void testSwappedSectionsFlagAmbiguity() {
        Song song;
        song.setLyrics("[verse]\na\n[chorus]\nb");
        tagTokens(song);

        auto report = song.setLyrics("[chorus]\nb\n[verse]\na");

        QCOMPARE(report.merged(), size_t(1));
        QCOMPARE(report.ambiguous(), size_t(1));
    }

    void testRepeatedNamesAlignInOrder() {
        Song song;
        song.setLyrics("[verse]\n1\n[chorus]\n2\n[verse]\n3\n[chorus]\n4");
        tagTokens(song);

        song.setLyrics("[verse]\n1\n[chorus]\n2\n[verse]\n3\n[chorus]\n4\n[outro]\n5");

        for (usize i = 0; i < 4; ++i) {
            QCOMPARE(firstToken(song, i), static_cast<Token>(100 * (i + 1)));
        }
        QCOMPARE(firstToken(song, 4), Token{-1});
    }

    void testMergeForwardDirect() {
        std::vector<SongSegment> previous{SongSegment::create("a", {}, "")};
        previous[0].setTrack(Stage::Refine, Track::Instrumental, {7, 8});
        std::vector<SongSegment> next{SongSegment::create("a", {}, "changed"),
                                      SongSegment::create("b", {}, "")};

        auto report = mergeForward(previous, next, MergeStrategy::Positional);

        QCOMPARE(report.entries.size(), size_t(2));
        QVERIFY(report.entries[0].oldIndex == std::optional<usize>(0));
        QVERIFY(!report.entries[1].oldIndex.has_value());
        QVERIFY(next[0].track(Stage::Refine, Track::Instrumental) == TokenSeq({7, 8}));
        QCOMPARE(next[0].lyrics(), std::string("changed"));
    }
};

int runTestSegmentMerge(int argc, char** argv) {
    TestSegmentMerge tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_SegmentMerge.moc"
