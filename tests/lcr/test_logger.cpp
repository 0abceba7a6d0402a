#include <iostream>
#include <sstream>
#include <string>

#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"
#include "common/log_capture.hpp"

using lcr::log::Level;


//
// Test 1: configuration strings map to levels.
//
void test_parse_level() {
    TEST_CHECK(lcr::log::parse_level("trace") == Level::Trace);
    TEST_CHECK(lcr::log::parse_level("debug") == Level::Debug);
    TEST_CHECK(lcr::log::parse_level("info") == Level::Info);
    TEST_CHECK(lcr::log::parse_level("warn") == Level::Warn);
    TEST_CHECK(lcr::log::parse_level("error") == Level::Error);
    TEST_CHECK(lcr::log::parse_level("fatal") == Level::Fatal);
    TEST_CHECK(lcr::log::parse_level("off") == Level::Off);
    TEST_CHECK(lcr::log::parse_level("bogus") == Level::Info);

    std::cout << "[OK] test_parse_level" << std::endl;
}

//
// Test 2: messages below the active level are dropped.
//
void test_level_filter() {
    LogCapture logs(Level::Warn);

    SEQ_DEBUG("hidden " << 1);
    SEQ_INFO("hidden " << 2);
    SEQ_WARN("shown " << 3);
    SEQ_ERROR("shown " << 4);

    TEST_CHECK(!logs.contains("hidden"));
    TEST_CHECK(logs.contains("[WARN] shown 3"));
    TEST_CHECK(logs.contains("[ERROR] shown 4"));

    std::cout << "[OK] test_level_filter" << std::endl;
}

//
// Test 3: Off silences everything, including fatal.
//
void test_off() {
    LogCapture logs(Level::Off);

    SEQ_FATAL("nothing");
    TEST_CHECK(logs.text().empty());

    std::cout << "[OK] test_off" << std::endl;
}

//
// Test 4: filtered messages are not formatted.
//
void test_lazy_formatting() {
    LogCapture logs(Level::Error);

    int evaluated = 0;
    auto probe = [&evaluated]() { ++evaluated; return "probe"; };

    SEQ_TRACE(probe());
    TEST_CHECK(evaluated == 0);

    SEQ_ERROR(probe());
    TEST_CHECK(evaluated == 1);
    TEST_CHECK(logs.contains("[ERROR] probe"));

    std::cout << "[OK] test_lazy_formatting" << std::endl;
}


int main() {
    test_parse_level();
    test_level_filter();
    test_off();
    test_lazy_formatting();
    std::cout << "[TEST] ALL LOGGER TESTS PASSED!\n";
    return 0;
}
