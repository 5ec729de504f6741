#include <QtTest>
#include "song/LyricsParser.hpp"

using namespace st;
using namespace st::song;

class TestLyricsParser : public QObject {
    Q_OBJECT

private slots:
    void testLengthInSeconds() {
        auto parsed = LyricsParser::parse("#length 3.0\n[verse]\nhello");

        QCOMPARE(parsed.segments.size(), size_t(1));
        const auto& seg = parsed.segments[0];
        QCOMPARE(seg.name, std::string("verse"));
        QCOMPARE(seg.lyrics, std::string("hello"));
        QVERIFY(seg.tags.count("length") == 1);
        QCOMPARE(std::get<i64>(seg.tags.at("length")), i64{150});
        QVERIFY(parsed.errors.empty());
    }

    void testLengthInTokens() {
        auto parsed = LyricsParser::parse("#length 200t\n[chorus]\nla");

        QCOMPARE(parsed.segments.size(), size_t(1));
        QCOMPARE(std::get<i64>(parsed.segments[0].tags.at("length")), i64{200});
    }

    void testFractionalSecondsTruncate() {
        auto parsed = LyricsParser::parse("#length 1.99\n[outro]\n");

        QCOMPARE(std::get<i64>(parsed.segments[0].tags.at("length")), i64{99});
    }

    void testInvalidLengthIsDropped() {
        auto parsed = LyricsParser::parse(
                "#length notanumber\n#mood calm\n[bridge]\nx");

        QCOMPARE(parsed.segments.size(), size_t(1));
        const auto& seg = parsed.segments[0];
        QCOMPARE(seg.name, std::string("bridge"));
        QCOMPARE(seg.lyrics, std::string("x"));
        QVERIFY(seg.tags.count("length") == 0);
        QCOMPARE(std::get<std::string>(seg.tags.at("mood")), std::string("calm"));

        QCOMPARE(parsed.errors.size(), size_t(1));
        QCOMPARE(parsed.errors[0].tagName, std::string("length"));
        QCOMPARE(parsed.errors[0].rawValue, std::string("notanumber"));
        QCOMPARE(parsed.errors[0].segmentName, std::string("bridge"));
    }

    void testNonFiniteLengthIsDropped() {
        auto parsed = LyricsParser::parse("#length inf\n[verse]\na\n#length 5t\n[chorus]\nb");

        QCOMPARE(parsed.segments.size(), size_t(2));
        QVERIFY(parsed.segments[0].tags.empty());
        QCOMPARE(std::get<i64>(parsed.segments[1].tags.at("length")), i64{5});
        QCOMPARE(parsed.errors.size(), size_t(1));
    }

    void testTagNamesLowercasedAndValuesTrimmed() {
        auto parsed = LyricsParser::parse("#Genre   dream pop  \n[Intro]\n");

        const auto& tags = parsed.segments[0].tags;
        QCOMPARE(std::get<std::string>(tags.at("genre")), std::string("dream pop"));
        QCOMPARE(parsed.segments[0].name, std::string("Intro"));
        QCOMPARE(parsed.segments[0].lyrics, std::string());
    }

    void testTagsAreScopedPerSegment() {
        auto parsed = LyricsParser::parse(
                "#length 10\n[verse]\nline one\nline two\n\n[chorus]\nhook\n");

        QCOMPARE(parsed.segments.size(), size_t(2));
        QCOMPARE(parsed.segments[0].lyrics, std::string("line one\nline two"));
        QCOMPARE(std::get<i64>(parsed.segments[0].tags.at("length")), i64{500});
        QVERIFY(parsed.segments[1].tags.empty());
        QCOMPARE(parsed.segments[1].lyrics, std::string("hook"));
    }

    void testNoHeaderYieldsNothing() {
        QVERIFY(LyricsParser::parse("").segments.empty());
        QVERIFY(LyricsParser::parse("just some words\nno sections").segments.empty());
        QVERIFY(LyricsParser::parse("#length 3\nno header").segments.empty());
    }

    void testMalformedBracketIsNotAHeader() {
        auto parsed = LyricsParser::parse("[verse]\nla [two words] la\n[chorus]\nok");

        QCOMPARE(parsed.segments.size(), size_t(2));
        QCOMPARE(parsed.segments[0].lyrics, std::string("la"));
        QCOMPARE(parsed.segments[1].name, std::string("chorus"));
        QCOMPARE(parsed.segments[1].lyrics, std::string("ok"));
    }

    void testTagBlockRunsToNextValidHeader() {
        auto parsed = LyricsParser::parse("#mood dark [not header] mood\n[verse]\nx");

        QCOMPARE(parsed.segments.size(), size_t(1));
        QCOMPARE(std::get<std::string>(parsed.segments[0].tags.at("mood")),
                 std::string("dark [not header] mood"));
    }

    void testHashEndsLyrics() {
        auto parsed = LyricsParser::parse("[verse]\nwe are #1\n[chorus]\nyes");

        QCOMPARE(parsed.segments.size(), size_t(2));
        QCOMPARE(parsed.segments[0].lyrics, std::string("we are"));
        QVERIFY(parsed.segments[1].tags.count("1") == 1);
    }

    void testTextBeforeFirstBlockIgnored() {
        auto parsed = LyricsParser::parse("title line\n#id a1\n[verse]\nhi");

        QCOMPARE(parsed.segments.size(), size_t(1));
        QCOMPARE(std::get<std::string>(parsed.segments[0].tags.at("id")),
                 std::string("a1"));
    }

    void testParseTagPassesStringsThrough() {
        auto value = LyricsParser::parseTag("mood", "12");
        QVERIFY(value.isOk());
        QCOMPARE(std::get<std::string>(*value), std::string("12"));

        QVERIFY(LyricsParser::parseTag("length", "").isErr());
        QVERIFY(LyricsParser::parseTag("length", "t").isErr());
        QVERIFY(LyricsParser::parseTag("length", "3.5t").isErr());
    }
};

int runTestLyricsParser(int argc, char** argv) {
    TestLyricsParser tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_LyricsParser.moc"
