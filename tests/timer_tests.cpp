#include "test_common.hpp"
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <regex>

using Catch::Approx;
using simpletimer::test_support::CerrCapture;
using simpletimer::test_support::sleep_ms;

static TimerOptions unstarted() {
    TimerOptions o;
    o.start = false;
    return o;
}

static TimerOptions coarse() {
    TimerOptions o;
    o.hires = false;
    return o;
}

TEST_CASE("Unstarted timer refuses elapsed-time queries") {
    Timer t(unstarted());
    REQUIRE_FALSE(t.started());
    REQUIRE_THROWS_AS(t.elapsed(), NotStartedError);
    REQUIRE_THROWS_AS(t.hms(), NotStartedError);
    REQUIRE_THROWS_AS(t.hms_parts(), NotStartedError);
    REQUIRE_THROWS_AS(t.string(), NotStartedError);
    REQUIRE_THROWS_AS(t.string("human"), NotStartedError);
    REQUIRE_THROWS_AS(static_cast<double>(t), NotStartedError);
    REQUIRE_THROWS_AS(t.stop_elapsed(), NotStartedError);
}

TEST_CASE("NotStartedError names the failed precondition") {
    Timer t(unstarted());
    try {
        (void)t.elapsed();
        FAIL("elapsed() did not throw");
    } catch (const NotStartedError& e) {
        REQUIRE(std::string(e.what()) == "Timer never started!");
    }
}

TEST_CASE("stop on an unstarted timer does not throw") {
    Timer t(unstarted());
    REQUIRE_NOTHROW(t.stop());
    REQUIRE(t.stopped());
    REQUIRE_THROWS_AS(t.elapsed(), NotStartedError);
    t.start();
    REQUIRE_FALSE(t.stopped());
    REQUIRE_NOTHROW(t.elapsed());
}

TEST_CASE("Timer starts by default") {
    Timer t;
    REQUIRE(t.started());
    REQUIRE_FALSE(t.stopped());
    REQUIRE(t.elapsed() >= 0.0);
    REQUIRE(t.hires() == hires_available());
}

TEST_CASE("Running timer elapsed time does not decrease") {
    Timer t;
    double a = t.elapsed();
    sleep_ms(20);
    double b = t.elapsed();
    REQUIRE(b >= a);
    if (t.hires())
        REQUIRE(b > a);
}

TEST_CASE("Stopped timer keeps a fixed elapsed time") {
    TimerOptions o = unstarted();
    Timer t(o);
    t.start();
    if (t.hires())
        sleep_ms(250);
    else
        sleep_ms(2000);
    REQUIRE(t.elapsed() > 0);
    t.stop();
    double first = t.elapsed();
    sleep_ms(t.hires() ? 50 : 1100);
    double second = t.elapsed();
    REQUIRE(first == second);
}

TEST_CASE("Coarse timer measures whole seconds") {
    Timer t(coarse());
    REQUIRE_FALSE(t.hires());
    REQUIRE(t.hms_format() == "%02d:%02d:%02d");
    sleep_ms(1100);
    double e = t.stop_elapsed();
    REQUIRE(e >= 1.0);
    REQUIRE(e == static_cast<double>(static_cast<long long>(e)));
}

TEST_CASE("Second stop keeps the first stop time") {
    Timer t;
    t.stop();
    double e = t.elapsed();
    sleep_ms(t.hires() ? 30 : 1100);
    t.stop();
    REQUIRE(t.elapsed() == e);
    REQUIRE(t.stop_elapsed() == e);
}

TEST_CASE("stop_elapsed returns the elapsed time at the stop") {
    Timer t;
    sleep_ms(10);
    double e = t.stop_elapsed();
    REQUIRE(e == t.elapsed());
    REQUIRE(static_cast<double>(t) == e);
}

TEST_CASE("restart forgets the stop time") {
    Timer t;
    sleep_ms(10);
    t.stop();
    REQUIRE(t.stopped());
    t.restart();
    REQUIRE_FALSE(t.stopped());
    REQUIRE(t.started());
}

TEST_CASE("Requesting sub-second precision follows availability") {
    TimerOptions o;
    o.hires = true;
    Timer t(o);
    REQUIRE(t.hires() == hires_available());
    if (t.hires())
        REQUIRE(t.hms_format() == "%02d:%02d:%09.6f");
}

TEST_CASE("Default string shows seconds and hms") {
    Timer t;
    sleep_ms(10);
    std::string s = t.string();
    INFO(s);
    std::regex pattern(R"(^\d+(\.\d+)?s \(\d{2}:\d{2}:\d{2}(\.\d{6})?\)$)");
    REQUIRE(std::regex_match(s, pattern));
}

TEST_CASE("Named string formats") {
    Timer t;
    sleep_ms(50);
    t.stop();
    double e = t.elapsed();
    HmsParts p = separate_hms(e);
    std::string human = std::to_string(p.hours) + " hours " + std::to_string(p.minutes) +
                        " minutes " + format_number(p.seconds) + " seconds";

    REQUIRE(t.string("short") == format_number(e) + "s (" + t.hms() + ")");
    REQUIRE(t.string(FormatKind::Short) == t.string("short"));
    REQUIRE(t.string("human") == human);
    REQUIRE(t.string("full") == format_number(e) + " seconds (" + human + ")");
    REQUIRE(t.string("hms") == t.hms());
    REQUIRE(t.string("elapsed") == format_number(e));
    REQUIRE(std::regex_match(t.string("rps"), std::regex(R"(^\d+\.\d{6}s \((\d+\.\d{3}|\?\?)/s\)$)")));
}

TEST_CASE("rps with zero elapsed time shows ??") {
    std::string s;
    // a coarse start/stop pair can straddle a second boundary; retry until it does not
    for (int attempt = 0; attempt < 5; ++attempt) {
        Timer t(coarse());
        t.stop();
        if (t.elapsed() == 0) {
            s = t.string("rps");
            break;
        }
    }
    REQUIRE(s == "0.000000s (??/s)");
}

TEST_CASE("rps of a stopped timer") {
    TimerOptions o = coarse();
    Timer t(o);
    sleep_ms(1100);
    t.stop();
    double e = t.elapsed();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%f", e);
    std::string expected = std::string(buf) + "s (";
    std::snprintf(buf, sizeof(buf), "%.3f", 1 / e);
    expected += std::string(buf) + "/s)";
    REQUIRE(t.string("rps") == expected);
}

TEST_CASE("Unknown format name is rejected") {
    Timer t;
    REQUIRE_THROWS_AS(t.string("bogus-name"), UnknownFormatError);
    try {
        (void)t.string("bogus-name");
        FAIL("string() did not throw");
    } catch (const UnknownFormatError& e) {
        REQUIRE(e.format_name() == "bogus-name");
        REQUIRE(std::string(e.what()) == "Unknown format: bogus-name");
    }
}

TEST_CASE("Format names round-trip") {
    for (FormatKind k : {FormatKind::Short, FormatKind::Rps, FormatKind::Human, FormatKind::Full,
                         FormatKind::Hms, FormatKind::Elapsed}) {
        auto parsed = parse_format_kind(format_kind_name(k));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == k);
    }
    REQUIRE_FALSE(parse_format_kind("Short").has_value());
}

TEST_CASE("Callback string format") {
    TimerOptions o;
    o.string = FormatCallback([](const Timer& t) { return "took " + t.hms("%d:%d:%.0f"); });
    Timer t(o);
    t.stop();
    REQUIRE(t.string() == "took " + t.hms("%d:%d:%.0f"));
    REQUIRE(t.string(StringFormat{FormatCallback([](const Timer&) { return std::string("x"); })}) ==
            "x");
    REQUIRE_THROWS_AS(t.string(StringFormat{FormatCallback{}}), UnknownFormatError);
}

TEST_CASE("Configured default string format") {
    TimerOptions o;
    o.string = FormatKind::Human;
    Timer t(o);
    t.stop();
    REQUIRE(t.string() == t.string("human"));
}

TEST_CASE("hms uses the configured or the given template") {
    TimerOptions o;
    o.hms = "%dh %dm %.0fs";
    Timer t(o);
    t.stop();
    REQUIRE(t.hms_format() == "%dh %dm %.0fs");
    REQUIRE(t.hms() == "0h 0m 0s");
    REQUIRE(t.hms("%02d|%02d|%02d") == "00|00|00");
    REQUIRE(t.string("short").find("(0h 0m 0s)") != std::string::npos);
    HmsParts p = t.hms_parts();
    REQUIRE(p.hours == 0);
    REQUIRE(p.minutes == 0);
    REQUIRE(p.seconds == Approx(t.elapsed()));
}

TEST_CASE("Deprecated format option maps to hms with a warning") {
    shutdown_logger();
    CerrCapture capture;
    TimerOptions o;
    o.format = "%d-%d-%d";
    Timer t(o);
    REQUIRE(t.hms_format() == "%d-%d-%d");
    REQUIRE(capture.str().find("Timer option 'format' is deprecated") != std::string::npos);
}

TEST_CASE("hms option wins over the deprecated format option") {
    shutdown_logger();
    CerrCapture capture;
    TimerOptions o;
    o.hms = "%d/%d/%d";
    o.format = "%d-%d-%d";
    Timer t(o);
    REQUIRE(t.hms_format() == "%d/%d/%d");
}

TEST_CASE("Timer stream output, to_string and sums") {
    Timer a;
    Timer b;
    a.stop();
    b.stop();
    std::ostringstream oss;
    oss << a;
    REQUIRE(oss.str() == a.string());
    REQUIRE(to_string(a) == a.string());
    REQUIRE(a + b == Approx(a.elapsed() + b.elapsed()));
    REQUIRE(static_cast<double>(a) + static_cast<double>(b) == a + b);
}

TEST_CASE("Timer copies carry their own state") {
    Timer a;
    Timer b = a;
    b.stop();
    sleep_ms(10);
    REQUIRE(b.stopped());
    REQUIRE_FALSE(a.stopped());
}
