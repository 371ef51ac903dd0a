#include <gtest/gtest.h>
#include "../include/mpv_protocol.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace qrplay;

TEST(MpvProtocol, EncodeCommandIsOneJsonLine) {
    std::string line = mpv::encode_command({"seek", "-10", "relative"}, 7);

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(std::count(line.begin(), line.end(), '\n'), 1);

    auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json["request_id"], 7);
    ASSERT_TRUE(json["command"].is_array());
    EXPECT_EQ(json["command"].size(), 3u);
    EXPECT_EQ(json["command"][0], "seek");
    EXPECT_EQ(json["command"][1], "-10");
    EXPECT_EQ(json["command"][2], "relative");
}

TEST(MpvProtocol, EncodeCommandEscapesText) {
    std::string line = mpv::encode_command({"loadfile", "media/a \"b\".mp4"}, 1);
    auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json["command"][1], "media/a \"b\".mp4");
}

TEST(MpvProtocol, EncodeObserveProperty) {
    auto json = nlohmann::json::parse(mpv::encode_observe_property("pause", mpv::PAUSE_OBSERVER_ID, 3));

    EXPECT_EQ(json["command"][0], "observe_property");
    EXPECT_EQ(json["command"][1], mpv::PAUSE_OBSERVER_ID);
    EXPECT_EQ(json["command"][2], "pause");
    EXPECT_EQ(json["request_id"], 3);
}

TEST(MpvProtocol, ParseSuccessResponse) {
    auto message = mpv::parse_message(R"({"data":null,"request_id":12,"error":"success"})");

    EXPECT_EQ(message.kind, mpv::Message::Kind::RESPONSE);
    EXPECT_EQ(message.request_id, 12);
    EXPECT_TRUE(message.succeeded());
}

TEST(MpvProtocol, ParseErrorResponse) {
    auto message = mpv::parse_message(R"({"request_id":4,"error":"property unavailable"})");

    EXPECT_EQ(message.kind, mpv::Message::Kind::RESPONSE);
    EXPECT_FALSE(message.succeeded());
}

TEST(MpvProtocol, EndFileEofEndsPlayback) {
    auto message = mpv::parse_message(R"({"event":"end-file","reason":"eof","playlist_entry_id":1})");

    EXPECT_EQ(message.kind, mpv::Message::Kind::EVENT);
    EXPECT_TRUE(message.is_playback_end());
}

TEST(MpvProtocol, EndFileErrorEndsPlayback) {
    EXPECT_TRUE(mpv::parse_message(R"({"event":"end-file","reason":"error"})").is_playback_end());
}

TEST(MpvProtocol, EndFileFromStopOrQuitIsNotPlaybackEnd) {
    EXPECT_FALSE(mpv::parse_message(R"({"event":"end-file","reason":"stop"})").is_playback_end());
    EXPECT_FALSE(mpv::parse_message(R"({"event":"end-file","reason":"quit"})").is_playback_end());
    EXPECT_FALSE(mpv::parse_message(R"({"event":"idle"})").is_playback_end());
}

TEST(MpvProtocol, PausePropertyChange) {
    auto paused = mpv::parse_message(R"({"event":"property-change","id":1,"name":"pause","data":true})");
    auto resumed = mpv::parse_message(R"({"event":"property-change","id":1,"name":"pause","data":false})");

    ASSERT_TRUE(paused.is_pause_change());
    ASSERT_TRUE(resumed.is_pause_change());
    EXPECT_TRUE(*paused.flag);
    EXPECT_FALSE(*resumed.flag);
}

TEST(MpvProtocol, PropertyChangeWithoutDataIsIgnored) {
    auto message = mpv::parse_message(R"({"event":"property-change","id":1,"name":"pause"})");
    EXPECT_FALSE(message.is_pause_change());
}

TEST(MpvProtocol, MalformedInputIsUnknown) {
    EXPECT_EQ(mpv::parse_message("").kind, mpv::Message::Kind::UNKNOWN);
    EXPECT_EQ(mpv::parse_message("{not json").kind, mpv::Message::Kind::UNKNOWN);
    EXPECT_EQ(mpv::parse_message("[1,2,3]").kind, mpv::Message::Kind::UNKNOWN);
    EXPECT_EQ(mpv::parse_message(R"({"foo":1})").kind, mpv::Message::Kind::UNKNOWN);
}

TEST(MpvProtocol, LaunchArgsShape) {
    auto args = mpv::build_launch_args("mpv", "/tmp/test-socket", "media/bluey.mp4", true, false, {});

    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args.front(), "mpv");
    EXPECT_EQ(args[args.size() - 2], "--");
    EXPECT_EQ(args.back(), "media/bluey.mp4");

    auto has = [&](const std::string& flag) {
        return std::find(args.begin(), args.end(), flag) != args.end();
    };
    EXPECT_TRUE(has("--input-ipc-server=/tmp/test-socket"));
    EXPECT_TRUE(has("--fullscreen=yes"));
    EXPECT_TRUE(has("--idle=yes"));
    EXPECT_TRUE(has("--force-window=yes"));
    EXPECT_TRUE(has("--image-display-duration=inf"));
    EXPECT_TRUE(has("--no-input-default-bindings"));
    EXPECT_FALSE(has("--pause=yes"));
}

TEST(MpvProtocol, LaunchArgsWindowedPausedAndExtras) {
    auto args = mpv::build_launch_args("/usr/bin/mpv", "/tmp/s", "-odd-name.mp4", false, true, {"--volume=50"});

    auto position = [&](const std::string& flag) {
        return std::find(args.begin(), args.end(), flag) - args.begin();
    };
    EXPECT_LT(position("--fullscreen=no"), position("--"));
    EXPECT_LT(position("--pause=yes"), position("--"));
    EXPECT_LT(position("--volume=50"), position("--"));
    EXPECT_EQ(args.back(), "-odd-name.mp4");
}
