#include <gtest/gtest.h>
#include "../include/scan_source.hpp"
#include "../include/logger.hpp"
#include <chrono>
#include <sstream>
#include <thread>

using namespace qrplay;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

}

class EvdevScanSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_output(&log_output);
        Logger::set_level(Logger::Level::INFO);
    }

    void TearDown() override {
        Logger::set_output(nullptr);
    }

    std::ostringstream log_output;
};

TEST_F(EvdevScanSourceTest, UnknownDeviceIsNotFound) {
    EXPECT_FALSE(find_input_device("qrplay-no-such-scanner").has_value());
}

TEST_F(EvdevScanSourceTest, MissingDeviceIsReportedOnceWhileRetrying) {
    EvdevScanSource source("qrplay-no-such-scanner", std::chrono::milliseconds(50));
    ASSERT_TRUE(source.initialize());
    source.process_messages();

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    source.shutdown();

    std::string log = log_output.str();
    EXPECT_EQ(count_occurrences(log, "DeviceUnavailable"), 1u);
    EXPECT_NE(log.find("qrplay-no-such-scanner"), std::string::npos);
}

TEST_F(EvdevScanSourceTest, ShutdownInterruptsReconnectWait) {
    EvdevScanSource source("qrplay-no-such-scanner", std::chrono::seconds(30));
    ASSERT_TRUE(source.initialize());
    source.process_messages();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto begin = std::chrono::steady_clock::now();
    source.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_NE(log_output.str().find("DeviceUnavailable"), std::string::npos);
}
