#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "core/errors.h"
#include "scheduler/duration.h"

using namespace std::chrono;
using dcron::scheduler::parseDuration;
using dcron::scheduler::formatDuration;

static bool parse_fails(const std::string& s) {
    try {
        (void)parseDuration(s);
    } catch (const dcron::ParseError&) {
        return true;
    }
    return false;
}

static void test_basic_units() {
    assert(parseDuration("0") == nanoseconds(0));
    assert(parseDuration("-0") == nanoseconds(0));
    assert(parseDuration("300ms") == milliseconds(300));
    assert(parseDuration("5s") == seconds(5));
    assert(parseDuration("2m") == minutes(2));
    assert(parseDuration("1h") == hours(1));
    assert(parseDuration("10ns") == nanoseconds(10));
    assert(parseDuration("7us") == microseconds(7));
    assert(parseDuration("7\xC2\xB5s") == microseconds(7));   // micro sign
    assert(parseDuration("7\xCE\xBCs") == microseconds(7));   // greek mu
    std::cout << "[OK] basic units\n";
}

static void test_compound_and_fraction() {
    assert(parseDuration("2h45m") == hours(2) + minutes(45));
    assert(parseDuration("1m30s") == seconds(90));
    assert(parseDuration("1.5h") == minutes(90));
    assert(parseDuration("1.5s") == milliseconds(1500));
    assert(parseDuration(".5s") == milliseconds(500));
    assert(parseDuration("1.s") == seconds(1));
    assert(parseDuration("-1s") == seconds(-1));
    assert(parseDuration("+2s") == seconds(2));
    assert(parseDuration("1h1m1s1ms") == hours(1) + minutes(1) + seconds(1) + milliseconds(1));
    std::cout << "[OK] compound / fraction / sign\n";
}

static void test_invalid() {
    assert(parse_fails(""));
    assert(parse_fails("-"));
    assert(parse_fails("1"));        // 缺单位
    assert(parse_fails("s"));
    assert(parse_fails(".s"));
    assert(parse_fails("1x"));
    assert(parse_fails("1mo"));
    assert(parse_fails("1s2"));
    assert(parse_fails("3000000h")); // 溢出
    std::cout << "[OK] invalid literals rejected\n";
}

static void test_format() {
    assert(formatDuration(milliseconds(300)) == "300ms");
    assert(formatDuration(seconds(5)) == "5s");
    assert(formatDuration(seconds(90)) == "1m30s");
    assert(formatDuration(milliseconds(1500)) == "1.500s");
    assert(formatDuration(-seconds(2)) == "-2s");
    std::cout << "[OK] formatDuration\n";
}

int main() {
    test_basic_units();
    test_compound_and_fraction();
    test_invalid();
    test_format();
    std::cout << "all duration tests passed\n";
    return 0;
}
