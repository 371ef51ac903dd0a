#include <gtest/gtest.h>
#include "../include/token_classifier.hpp"
#include "../include/logger.hpp"
#include <sstream>

using namespace qrplay;
using namespace std::chrono_literals;

class TokenClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_output(&log_output);
        start = Clock::now();
    }

    void TearDown() override {
        Logger::set_output(nullptr);
    }

    std::ostringstream log_output;
    TokenClassifier classifier;
    TimePoint start;
};

TEST_F(TokenClassifierTest, MediaReferenceIsNormalized) {
    auto result = classifier.classify("  Bluey-S1E1 ", start);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, Classification::Kind::MEDIA);
    EXPECT_EQ(result->reference, "bluey-s1e1");
}

TEST_F(TokenClassifierTest, CommandNames) {
    struct Case {
        const char* token;
        Command command;
    };
    const Case cases[] = {
        {"CMD:PAUSE", Command::PAUSE},
        {"CMD:STOP", Command::STOP},
        {"CMD:VOLUP", Command::VOLUME_UP},
        {"CMD:VOLDOWN", Command::VOLUME_DOWN},
        {"CMD:MUTE", Command::MUTE},
        {"CMD:FWD", Command::SEEK_FORWARD},
        {"CMD:RWD", Command::SEEK_BACKWARD},
        {"CMD:EXIT", Command::EXIT},
        {"CMD:VolumeUp", Command::VOLUME_UP},
        {"CMD:seekbackward", Command::SEEK_BACKWARD},
    };

    for (const auto& c : cases) {
        auto result = classifier.interpret(c.token);
        EXPECT_EQ(result.kind, Classification::Kind::COMMAND) << c.token;
        EXPECT_EQ(result.command, c.command) << c.token;
    }
}

TEST_F(TokenClassifierTest, PrefixIsCaseSensitive) {
    auto result = classifier.interpret("cmd:pause");
    EXPECT_EQ(result.kind, Classification::Kind::MEDIA);
    EXPECT_EQ(result.reference, "cmd:pause");
}

TEST_F(TokenClassifierTest, UnknownCommandIsInvalid) {
    auto result = classifier.classify("CMD:DANCE", start);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, Classification::Kind::INVALID);
    EXPECT_NE(log_output.str().find("InvalidCommand"), std::string::npos);
}

TEST_F(TokenClassifierTest, PathTraversalIsInvalid) {
    EXPECT_EQ(classifier.interpret("../secret").kind, Classification::Kind::INVALID);
    EXPECT_EQ(classifier.interpret("shows/bluey").kind, Classification::Kind::INVALID);
    EXPECT_EQ(classifier.interpret("a..b").kind, Classification::Kind::INVALID);
    EXPECT_EQ(classifier.interpret("bluey.s1").kind, Classification::Kind::MEDIA);
}

TEST_F(TokenClassifierTest, EmptyTokenIsDropped) {
    EXPECT_FALSE(classifier.classify("", start).has_value());
    EXPECT_FALSE(classifier.classify("   ", start).has_value());
}

TEST_F(TokenClassifierTest, DuplicateWithinWindowIsDebounced) {
    ASSERT_TRUE(classifier.classify("bluey", start).has_value());
    EXPECT_FALSE(classifier.classify("bluey", start + 500ms).has_value());
}

TEST_F(TokenClassifierTest, DuplicateAfterWindowIsAccepted) {
    ASSERT_TRUE(classifier.classify("bluey", start).has_value());
    EXPECT_TRUE(classifier.classify("bluey", start + 3s).has_value());
}

TEST_F(TokenClassifierTest, DebounceComparesNormalizedIdentity) {
    ASSERT_TRUE(classifier.classify("Bluey", start).has_value());
    EXPECT_FALSE(classifier.classify(" BLUEY", start + 100ms).has_value());

    ASSERT_TRUE(classifier.classify("CMD:VOLUP", start + 200ms).has_value());
    EXPECT_FALSE(classifier.classify("CMD:VolumeUp", start + 300ms).has_value());
}

TEST_F(TokenClassifierTest, DifferentTokenIsNeverDebounced) {
    ASSERT_TRUE(classifier.classify("CMD:PAUSE", start).has_value());
    ASSERT_TRUE(classifier.classify("CMD:STOP", start + 100ms).has_value());
    EXPECT_TRUE(classifier.classify("CMD:PAUSE", start + 200ms).has_value());
}

TEST_F(TokenClassifierTest, WindowMeasuredFromLastAcceptedScan) {
    ASSERT_TRUE(classifier.classify("bluey", start).has_value());
    EXPECT_FALSE(classifier.classify("bluey", start + 1500ms).has_value());
    // Suppressed scans do not extend the window
    EXPECT_TRUE(classifier.classify("bluey", start + 2000ms).has_value());
}

TEST_F(TokenClassifierTest, InvalidTokenDoesNotTouchDebounceSlot) {
    ASSERT_TRUE(classifier.classify("bluey", start).has_value());
    classifier.classify("CMD:NOPE", start + 100ms);
    EXPECT_FALSE(classifier.classify("bluey", start + 200ms).has_value());
}

TEST_F(TokenClassifierTest, ZeroWindowDisablesDebounce) {
    TokenClassifier immediate(0ms);
    ASSERT_TRUE(immediate.classify("bluey", start).has_value());
    EXPECT_TRUE(immediate.classify("bluey", start).has_value());
}

TEST_F(TokenClassifierTest, ResetForgetsLastScan) {
    ASSERT_TRUE(classifier.classify("bluey", start).has_value());
    classifier.reset();
    EXPECT_TRUE(classifier.classify("bluey", start + 10ms).has_value());
}

TEST_F(TokenClassifierTest, CustomPrefix) {
    TokenClassifier custom(2000ms, "DO:");
    EXPECT_EQ(custom.interpret("DO:MUTE").kind, Classification::Kind::COMMAND);
    EXPECT_EQ(custom.interpret("CMD:MUTE").kind, Classification::Kind::MEDIA);
}
