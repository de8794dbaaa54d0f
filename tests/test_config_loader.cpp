#include "input_module/config_loader.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "test_support.hpp"

using namespace fw::iom;

static bool rejects(const std::string& text) {
    ConfigLoader loader;
    try {
        (void)loader.loadFromString(text);
    } catch (const std::runtime_error& ex) {
        std::cout << "  rejected as expected: " << ex.what() << '\n';
        return true;
    }
    return false;
}

static void testDefaults() {
    ConfigLoader loader;
    auto config = loader.loadFromString("");
    ASSERT_TRUE(config.transport == "hidapi", "hidapi by default");
    ASSERT_EQ(config.retry.max_retries, 3u, "default retries");
    ASSERT_EQ(config.retry.backoff.size(), static_cast<std::size_t>(3), "default backoff schedule");
    ASSERT_TRUE(config.retry.allow_reopen, "reopen allowed by default");
    ASSERT_TRUE(config.signatures.empty(), "no extra signatures");
    ASSERT_EQ(config.stats.brightness, 255, "default stats brightness");
    ASSERT_EQ(config.stats.max_displays, static_cast<std::size_t>(2), "two displays");
}

static void testFullFile() {
    const std::string text = R"(
transport = "logging"

[session]
max_retries = 5
backoff_ms = [5, 50]
allow_reopen = false
write_timeout_ms = 250
read_timeout_ms = 300

[[signatures]]
name = "Bench matrix"
vendor_id = 0x1234
product_id = 0x0001
kind = "led_matrix"

[[signatures]]
vendor_id = 0x1234
product_id = 0x0002
kind = "Keyboard_Backlight"
usage_page = 0xFF60
usage = 0x61

[stats]
brightness = 40
frame_interval_ms = 500
background = 0
bar_intensity = 90
max_displays = 1
)";

    ConfigLoader loader;
    auto config = loader.loadFromString(text, "full.toml");
    ASSERT_TRUE(config.transport == "logging", "transport");
    ASSERT_EQ(config.retry.max_retries, 5u, "max_retries");
    ASSERT_EQ(config.retry.backoff.size(), static_cast<std::size_t>(2), "backoff entries");
    ASSERT_EQ(config.retry.backoff.back().count(), 50, "backoff value");
    ASSERT_TRUE(!config.retry.allow_reopen, "allow_reopen");
    ASSERT_EQ(config.retry.write_timeout.count(), 250, "write timeout");
    ASSERT_EQ(config.retry.read_timeout.count(), 300, "read timeout");

    ASSERT_EQ(config.signatures.size(), static_cast<std::size_t>(2), "two signatures");
    if (config.signatures.size() == 2) {
        ASSERT_TRUE(config.signatures[0].name == "Bench matrix", "signature name");
        ASSERT_EQ(config.signatures[0].vendor_id, static_cast<std::uint16_t>(0x1234), "vendor id");
        ASSERT_TRUE(!config.signatures[0].usage_page.has_value(), "usage filter is optional");
        ASSERT_TRUE(config.signatures[1].kind == DeviceKind::KeyboardBacklight, "kind is case-insensitive");
        ASSERT_TRUE(config.signatures[1].usage_page == std::uint16_t{0xFF60}, "usage page");
    }

    ASSERT_EQ(config.stats.brightness, 40, "stats brightness");
    ASSERT_EQ(config.stats.frame_interval.count(), 500, "frame interval");
    ASSERT_EQ(config.stats.background, 0, "background");
    ASSERT_EQ(config.stats.bar_intensity, 90, "bar intensity");
    ASSERT_EQ(config.stats.max_displays, static_cast<std::size_t>(1), "max displays");
}

static void testRejected() {
    ASSERT_TRUE(rejects("transport = \"serial\""), "unknown transport");
    ASSERT_TRUE(rejects("transport = 3"), "mistyped transport");
    ASSERT_TRUE(rejects("[session]\nmax_retries = 0"), "zero retries");
    ASSERT_TRUE(rejects("[session]\nbackoff_ms = 10"), "backoff must be an array");
    ASSERT_TRUE(rejects("[session]\nbackoff_ms = [-1]"), "negative backoff");
    ASSERT_TRUE(rejects("session = 4"), "session must be a table");
    ASSERT_TRUE(rejects("[stats]\nbrightness = 256"), "brightness above 255");
    ASSERT_TRUE(rejects("[[signatures]]\nvendor_id = 1\nproduct_id = 2"), "signature without kind");
    ASSERT_TRUE(rejects("[[signatures]]\nvendor_id = 1\nproduct_id = 2\nkind = \"toaster\""), "unknown kind");
    ASSERT_TRUE(rejects("[[signatures]]\nvendor_id = 70000\nproduct_id = 2\nkind = \"other\""), "vendor id out of range");
    ASSERT_TRUE(rejects("transport = "), "syntax error");
}

static void testMissingFile() {
    ConfigLoader loader;
    bool threw = false;
    try {
        (void)loader.loadFromFile("/nonexistent/input_module.toml");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "missing file");
}

int main() {
    testDefaults();
    testFullFile();
    testRejected();
    testMissingFile();
    return finishTests("ConfigLoader");
}
