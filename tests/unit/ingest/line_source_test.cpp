#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "fxp/ingest/line_source.hpp"

using namespace fxp::ingest;
using fxp::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

class LineSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("fxp_line_source_" + std::to_string(rd()));
        fs::create_directories(dir_);
        path_ = dir_ / "server.log";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void append(const std::string& text) {
        std::ofstream out(path_, std::ios::app | std::ios::binary);
        out << text;
    }

    LineSourceConfig config(bool startAtEnd) const {
        LineSourceConfig cfg;
        cfg.path = path_;
        cfg.pollInterval = 1ms;
        cfg.startAtEnd = startAtEnd;
        return cfg;
    }

    // next() + commit(); empty string when no line is ready.
    static std::string take(LineSource& source) {
        auto line = source.next();
        EXPECT_TRUE(line);
        if (!line || !line.value()) {
            return {};
        }
        source.commit();
        return *line.value();
    }

    fs::path dir_;
    fs::path path_;
};

} // namespace

TEST_F(LineSourceTest, StartAtEndSkipsExistingContent) {
    append("old line\n");
    LineSource source(config(true));
    ASSERT_TRUE(source.open());
    EXPECT_EQ(source.offset(), 9u);

    auto none = source.next();
    ASSERT_TRUE(none);
    EXPECT_FALSE(none.value().has_value());

    append("new line\n");
    EXPECT_EQ(take(source), "new line");
    EXPECT_EQ(source.offset(), 18u);
}

TEST_F(LineSourceTest, StartAtBeginningReadsExistingContent) {
    append("first\r\nsecond\n");
    LineSource source(config(false));
    ASSERT_TRUE(source.open());

    EXPECT_EQ(take(source), "first");
    EXPECT_EQ(take(source), "second");
    EXPECT_EQ(take(source), "");
}

TEST_F(LineSourceTest, UncommittedLineIsReturnedAgain) {
    LineSource source(config(true));
    ASSERT_TRUE(source.open());
    append("retry me\nafter\n");

    auto first = source.next();
    ASSERT_TRUE(first && first.value());
    auto again = source.next();
    ASSERT_TRUE(again && again.value());
    EXPECT_EQ(*first.value(), *again.value());
    EXPECT_EQ(source.offset(), 0u);

    source.commit();
    EXPECT_EQ(take(source), "after");
}

TEST_F(LineSourceTest, PartialLineWaitsForNewline) {
    LineSource source(config(true));
    ASSERT_TRUE(source.open());

    append("Player");
    EXPECT_EQ(take(source), "");
    append("C extracted\n");
    EXPECT_EQ(take(source), "PlayerC extracted");
}

TEST_F(LineSourceTest, CommitWithoutPendingLineIsNoop) {
    LineSource source(config(true));
    ASSERT_TRUE(source.open());
    source.commit();
    EXPECT_EQ(source.offset(), 0u);
}

TEST_F(LineSourceTest, TruncationResetsToNewEnd) {
    LineSource source(config(false));
    append("one\ntwo\nthree\n");
    ASSERT_TRUE(source.open());
    EXPECT_EQ(take(source), "one");
    EXPECT_EQ(take(source), "two");

    fs::resize_file(path_, 0);
    append("x\n");
    // Size (2) is below the cursor (8): resume at the end, "x" is lost.
    EXPECT_EQ(take(source), "");
    EXPECT_EQ(source.offset(), 2u);

    append("fresh\n");
    EXPECT_EQ(take(source), "fresh");
}

TEST_F(LineSourceTest, ReplacedFileResumesAtItsEnd) {
    LineSource source(config(true));
    append("before\n");
    ASSERT_TRUE(source.open());

    auto rotated = dir_ / "server.log.1";
    fs::rename(path_, rotated);
    append("already there\n");

    EXPECT_EQ(take(source), "");
    append("after rotation\n");
    EXPECT_EQ(take(source), "after rotation");
}

TEST_F(LineSourceTest, MissingFileYieldsNoLines) {
    LineSource source(config(true));
    ASSERT_TRUE(source.open());
    fs::remove(path_);

    auto line = source.next();
    ASSERT_TRUE(line);
    EXPECT_FALSE(line.value().has_value());
}

TEST_F(LineSourceTest, OpenCreatesMissingFileAndDirectories) {
    LineSourceConfig cfg = config(true);
    cfg.path = dir_ / "nested" / "logs" / "server.log";
    LineSource source(cfg);
    ASSERT_TRUE(source.open());
    EXPECT_TRUE(fs::exists(cfg.path));
    EXPECT_TRUE(source.isOpen());
    EXPECT_EQ(source.path(), cfg.path);
}

TEST_F(LineSourceTest, OpenFailsWhenCreationDisabled) {
    LineSourceConfig cfg = config(true);
    cfg.createIfMissing = false;
    LineSource source(cfg);

    auto result = source.open();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::SourceUnavailable);
    EXPECT_FALSE(source.isOpen());
}

TEST_F(LineSourceTest, NextBeforeOpenIsAnError) {
    LineSource source(config(true));
    auto line = source.next();
    ASSERT_FALSE(line);
    EXPECT_EQ(line.error().code(), ErrorCode::SourceUnavailable);
}
