#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "utils/ProgressMeter.hpp"

using namespace std::chrono_literals;

class ProgressMeterTest : public ::testing::Test {
protected:
    ManualClock clock;
    ProgressReader reader{std::make_unique<MemSource>(std::string(1000, 'x')), 1000, clock};
    ProgressMeter meter{reader};
    char buf[1000];
};

TEST_F(ProgressMeterTest, status_before_first_read) {
    EXPECT_EQ(meter.status(), "[⠋] 0b/1000b = 0.0%, 0s, 0b/s, eta: ?");
}

TEST_F(ProgressMeterTest, status_with_eta) {
    clock.advance(10s);
    reader.read(buf, 250);
    EXPECT_EQ(meter.status(), "[⠋] 250b/1000b = 25.0%, 10s, 25b/s, eta: 30s");
}

TEST_F(ProgressMeterTest, status_when_done) {
    clock.advance(125s);
    reader.read(buf, 1000);
    EXPECT_EQ(meter.status(), "[⠋] 1000b/1000b = 100.0%, 2m5s, 8b/s, eta: 0s");
}

TEST_F(ProgressMeterTest, update_is_throttled) {
    std::string out = capture_stdout([&]() {
        meter.update();
        meter.update();
    });
    EXPECT_EQ(out, "[⠋] 0b/1000b = 0.0%, 0s, 0b/s, eta: ?\x1b[0K\r");

    clock.advance(50ms);
    EXPECT_EQ(capture_stdout([&]() { meter.update(); }), "");

    clock.advance(50ms);
    reader.read(buf, 100);
    EXPECT_THAT(capture_stdout([&]() { meter.update(); }), HasSubstr("[⠙] 100b/1000b = 10.0%"));
}

TEST_F(ProgressMeterTest, finish_always_prints) {
    std::string out = capture_stdout([&]() {
        meter.update();
        reader.read(buf, 1000);
        meter.finish();
    });
    EXPECT_THAT(out, HasSubstr("\r[⠙] 1000b/1000b = 100.0%"));
    EXPECT_EQ(out.back(), '\n');
}

TEST(ProgressMeter, empty_source) {
    ManualClock clock;
    ProgressReader reader(std::make_unique<MemSource>(""), 0, clock);
    ProgressMeter meter(reader);
    EXPECT_EQ(meter.status(), "[⠋] 0b/0b = 100.0%, 0s, 0b/s, eta: 0s");
}

TEST(ProgressMeter, far_eta) {
    ManualClock clock;
    ProgressReader reader(std::make_unique<MemSource>("x"), 1ULL << 40, clock);
    ProgressMeter meter(reader);

    clock.advance(10s);
    char buf[1];
    reader.read(buf, 1);
    EXPECT_THAT(meter.status(), HasSubstr("eta: 106751d"));
}
