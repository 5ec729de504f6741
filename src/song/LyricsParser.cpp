#include "LyricsParser.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include "core/Logger.hpp"

namespace st::song {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

// Non-ASCII bytes count as word characters so UTF-8 section names survive
bool isWordChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u == '_' || u >= 0x80;
}

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string_view s) {
    std::string result(s);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

usize wordEnd(std::string_view text, usize pos) {
    while (pos < text.size() && isWordChar(text[pos]))
        ++pos;
    return pos;
}

struct Header {
    usize begin; // position of '['
    std::string_view name;
    usize end; // one past ']'
};

std::optional<Header> headerAt(std::string_view text, usize pos) {
    if (pos >= text.size() || text[pos] != '[')
        return std::nullopt;
    usize nameEnd = wordEnd(text, pos + 1);
    if (nameEnd == pos + 1 || nameEnd >= text.size() || text[nameEnd] != ']')
        return std::nullopt;
    return Header{pos, text.substr(pos + 1, nameEnd - pos - 1), nameEnd + 1};
}

// Finds valid headers front to back. The lookup result is cached so a run
// of '#' characters without a following header stays linear.
class HeaderFinder {
public:
    explicit HeaderFinder(std::string_view text) : text_(text) {}

    std::optional<Header> nextFrom(usize pos) {
        if (cached_ && searchedFrom_ <= pos &&
            (!cached_->has_value() || (*cached_)->begin >= pos)) {
            return *cached_;
        }
        searchedFrom_ = pos;
        cached_ = std::optional<Header>{};
        for (usize p = text_.find('[', pos); p != std::string_view::npos;
             p = text_.find('[', p + 1)) {
            if (auto h = headerAt(text_, p)) {
                cached_ = h;
                break;
            }
        }
        return *cached_;
    }

private:
    std::string_view text_;
    usize searchedFrom_{0};
    std::optional<std::optional<Header>> cached_;
};

struct RawTag {
    std::string_view name;
    std::string_view data;
};

// "#name data" entries; data runs to the next '#' or the end of the block
std::vector<RawTag> splitTags(std::string_view block) {
    std::vector<RawTag> tags;
    usize pos = 0;
    while (pos < block.size()) {
        if (block[pos] != '#') {
            ++pos;
            continue;
        }
        usize nameEnd = wordEnd(block, pos + 1);
        if (nameEnd == pos + 1) {
            ++pos;
            continue;
        }
        usize dataEnd = block.find('#', nameEnd);
        if (dataEnd == std::string_view::npos)
            dataEnd = block.size();
        tags.push_back({block.substr(pos + 1, nameEnd - pos - 1),
                        block.substr(nameEnd, dataEnd - nameEnd)});
        pos = dataEnd;
    }
    return tags;
}

Result<i64> parseInteger(std::string_view s) {
    s = trim(s);
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    i64 value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
        return Result<i64>::err("not an integer: '" + std::string(s) + "'");
    return Result<i64>::ok(value);
}

Result<f64> parseReal(std::string_view s) {
    s = trim(s);
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    f64 value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
        return Result<f64>::err("not a number: '" + std::string(s) + "'");
    return Result<f64>::ok(value);
}

} // namespace

Result<TagValue> LyricsParser::parseTag(std::string_view name,
                                        std::string_view value) {
    if (name != "length")
        return Result<TagValue>::ok(std::string(value));

    if (!value.empty() && value.back() == 't') {
        auto tokens = parseInteger(value.substr(0, value.size() - 1));
        if (tokens.isErr())
            return Result<TagValue>::err(tokens.error().message);
        return Result<TagValue>::ok(*tokens);
    }

    auto seconds = parseReal(value);
    if (seconds.isErr())
        return Result<TagValue>::err(seconds.error().message);

    f64 frames = *seconds * static_cast<f64>(kFramesPerSecond);
    constexpr f64 kLimit = static_cast<f64>(std::numeric_limits<i64>::max());
    if (!std::isfinite(frames) || std::fabs(frames) >= kLimit)
        return Result<TagValue>::err("length out of range");

    return Result<TagValue>::ok(static_cast<i64>(frames));
}

ParsedLyrics LyricsParser::parse(std::string_view script) {
    ParsedLyrics result;
    HeaderFinder finder(script);

    usize pos = 0;
    while (pos < script.size()) {
        std::string_view tagBlock;
        std::optional<Header> header;

        if (script[pos] == '#') {
            header = finder.nextFrom(pos);
            if (header)
                tagBlock = script.substr(pos, header->begin - pos);
        } else if (script[pos] == '[') {
            header = headerAt(script, pos);
        }

        if (!header) {
            ++pos;
            continue;
        }

        usize lyricsEnd = script.find_first_of("[#", header->end);
        if (lyricsEnd == std::string_view::npos)
            lyricsEnd = script.size();

        SegmentDescriptor segment;
        segment.name = std::string(trim(header->name));
        segment.lyrics = std::string(
                trim(script.substr(header->end, lyricsEnd - header->end)));

        for (const auto& raw : splitTags(tagBlock)) {
            auto tagName = toLower(trim(raw.name));
            auto tagData = trim(raw.data);

            auto value = parseTag(tagName, tagData);
            if (value.isErr()) {
                LOG_WARN("Invalid tag #{} {} in [{}]: {}",
                         tagName,
                         tagData,
                         segment.name,
                         value.error().message);
                result.errors.push_back({segment.name,
                                         tagName,
                                         std::string(tagData),
                                         value.error().message});
                continue;
            }
            segment.tags[tagName] = std::move(*value);
        }

        result.segments.push_back(std::move(segment));
        pos = lyricsEnd;
    }

    LOG_DEBUG("Parsed {} segments ({} tag errors)",
              result.segments.size(),
              result.errors.size());
    return result;
}

} // namespace st::song
