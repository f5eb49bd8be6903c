#include <gtest/gtest.h>
#include "name_template.hpp"
#include "errors.hpp"
#include "metadata_provider.hpp"
#include "test_support.hpp"

using namespace MediaOrganizer;
using namespace MediaOrganizer::testing;

class NameTemplateTest : public ::testing::Test {
protected:
    void SetUp() override {
        record.path = "/mnt/share/movies/movie.mp4";
        record.metadata = sampleMetadata(1080, "h264", 5400.0);
    }

    FileRecord record;
};

TEST_F(NameTemplateTest, FilenameAndResolution) {
    EXPECT_EQ(expandTemplate("{filename}_{resolution}", record), "movie_1080p.mp4");
}

TEST_F(NameTemplateTest, CodecAndDuration) {
    EXPECT_EQ(expandTemplate("{filename} [{codec}] {duration}", record), "movie [h264] 1h30m.mp4");
}

TEST_F(NameTemplateTest, ExtensionPlaceholderIsNotDoubled) {
    EXPECT_EQ(expandTemplate("{filename}.{extension}", record), "movie.mp4");
    EXPECT_EQ(expandTemplate("{extension}-{filename}", record), "mp4-movie.mp4");
}

TEST_F(NameTemplateTest, UnknownPlaceholderKeptVerbatim) {
    EXPECT_EQ(expandTemplate("{filename}_{resolutoin}", record), "movie_{resolutoin}.mp4");
}

TEST_F(NameTemplateTest, MissingMetadataKeepsPlaceholder) {
    record.metadata.reset();
    EXPECT_EQ(expandTemplate("{filename}_{resolution}", record), "movie_{resolution}.mp4");
}

TEST_F(NameTemplateTest, EmptyTemplateKeepsName) {
    EXPECT_EQ(expandTemplate("", record), "movie.mp4");
}

TEST_F(NameTemplateTest, UnclosedBraceIsLiteral) {
    EXPECT_EQ(expandTemplate("{filename}_{res", record), "movie_{res.mp4");
}

TEST_F(NameTemplateTest, PathSeparatorRejected) {
    try {
        expandTemplate("archive/{filename}", record);
        FAIL() << "expected InvalidTemplate";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidTemplate);
    }
}

TEST_F(NameTemplateTest, SmbInvalidCharactersRejected) {
    for (const char* pattern : {"a<b", "a>b", "a:b", "a\"b", "a\\b", "a|b", "a?b", "a*b"}) {
        EXPECT_THROW(expandTemplate(pattern, record), MediaError) << pattern;
    }
}

TEST(FileNameValidationTest, RejectsDotsAndTrailingSpace) {
    EXPECT_THROW(validateFileName(""), MediaError);
    EXPECT_THROW(validateFileName(".."), MediaError);
    EXPECT_THROW(validateFileName("movie "), MediaError);
    EXPECT_NO_THROW(validateFileName("movie (2010).mkv"));
}

TEST(PlaceholderTest, ClosedSetOfNames) {
    EXPECT_EQ(placeholderFromName("codec"), Placeholder::Codec);
    EXPECT_EQ(placeholderFromName("extension"), Placeholder::Extension);
    EXPECT_FALSE(placeholderFromName("Codec").has_value());
    EXPECT_FALSE(placeholderFromName("year").has_value());
}

TEST(ToLowerTest, LeavesNonAsciiBytesAlone) {
    // UTF-8 "É" is two bytes above 0x7F
    EXPECT_EQ(toLower("Caf\xC3\x89.MKV"), "caf\xC3\x89.mkv");
    EXPECT_EQ(toLower(".Mp4"), ".mp4");
    EXPECT_EQ(toLower(""), "");
}

TEST(FfprobeParseTest, ParsesCompactOutput) {
    const std::string output =
        "stream|index=0|codec_name=hevc|codec_type=video|width=3840|height=2160\n"
        "stream|index=1|codec_name=aac|codec_type=audio\n"
        "stream|index=2|codec_name=subrip|codec_type=subtitle|tag:language=eng|tag:title=SDH\n"
        "stream|index=3|codec_name=ass|codec_type=subtitle\n"
        "format|duration=2712.480000\n";

    MediaMetadata m = FfprobeMetadataProvider::parseCompactOutput(output);
    EXPECT_EQ(m.codec, "hevc");
    EXPECT_EQ(m.height, 2160);
    EXPECT_EQ(m.resolutionLabel(), "2160p");
    EXPECT_EQ(m.durationLabel(), "45m");
    ASSERT_EQ(m.subtitles.size(), 2u);
    EXPECT_EQ(m.subtitles[0].language, "eng");
    EXPECT_EQ(m.subtitles[0].title, "SDH");
    EXPECT_FALSE(m.subtitles[1].language.has_value());
}

TEST(FfprobeParseTest, EmptyOutputFails) {
    EXPECT_THROW(FfprobeMetadataProvider::parseCompactOutput(""), MediaError);
}

TEST(ShellQuoteTest, EscapesSingleQuotes) {
    EXPECT_EQ(shellQuote("it's.mkv"), "'it'\\''s.mkv'");
}
