#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <chunkit/assert.hpp>
#include <chunkit/chunks.hpp>
#include <chunkit/config.hpp>
#include <chunkit/trace.hpp>

#include "common.hpp"

using namespace chunkit;

// Redirect std::cerr for the lifetime of the object.
struct cerr_capture {
    std::ostringstream buf;
    std::streambuf* saved;

    cerr_capture(): saved(std::cerr.rdbuf(buf.rdbuf())) {}
    ~cerr_capture() { std::cerr.rdbuf(saved); }
};

TEST(trace, leader) {
    std::ostringstream o;
    util::debug_emit_trace_leader(o, "/some/where/file.hpp", 42, "a, b");

    auto s = o.str();
    EXPECT_EQ(0u, s.find("file.hpp:42 ["));
    EXPECT_NE(std::string::npos, s.find("] a, b: "));

    // Stream formatting is restored.
    o.str("");
    o << std::setw(3) << 5;
    EXPECT_EQ("  5", o.str());
}

TEST(trace, emit) {
    cerr_capture capture;
    util::debug_emit_trace("dir/x.cpp", 7, "n, s", 3, "four");

    auto s = capture.buf.str();
    EXPECT_EQ(0u, s.find("x.cpp:7 ["));
    EXPECT_NE(std::string::npos, s.find("n, s: 3, four\n"));
}

TEST(trace, drain) {
    cerr_capture capture;

    std::vector<int> arr = {1, 2, 3, 4, 5};
    auto cs = chunks(arr, 3);
    cs.next();
    cs.next();
    cs.next();

    auto s = capture.buf.str();
    if (config::has_trace) {
        EXPECT_NE(std::string::npos, s.find("generation_, pending_: 1, 2"));
        EXPECT_NE(std::string::npos, s.find("generation_, exhausted_: 2, 1"));
    }
    else {
        EXPECT_TRUE(s.empty());
    }
}

TEST(assertion, handler) {
    auto saved = global_failed_assertion_handler;

    static int failures;
    failures = 0;
    global_failed_assertion_handler =
        [](const char*, const char*, int, const char*) { ++failures; };

    chunkit_assert(1+1==3);
    global_failed_assertion_handler = saved;

    EXPECT_EQ(config::has_assertions? 1: 0, failures);

    global_failed_assertion_handler = ignore_failed_assertion;
    chunkit_assert(false);
    global_failed_assertion_handler = saved;
}
