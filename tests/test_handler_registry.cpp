#include <doctest/doctest.h>
#include "cecbridge/handler_registry.hpp"

#include <boost/regex.hpp>
#include <string>
#include <vector>

using namespace cecbridge;

TEST_CASE("Every matching entry fires, in registration order") {
    HandlerRegistry reg;
    std::vector<std::string> hits;

    reg.add_contains("input", [&](const std::string&) { hits.push_back("contains"); });
    reg.add_pattern(boost::regex("^waiting"), [&](const std::string&) { hits.push_back("pattern"); });
    reg.add_predicate([](const std::string& l) { return l.size() > 5; },
                      [&](const std::string&) { hits.push_back("predicate"); });
    reg.add_contains("nope", [&](const std::string&) { hits.push_back("never"); });

    CHECK(reg.size() == 4);
    CHECK(reg.dispatch("waiting for input") == 3);
    CHECK(hits == std::vector<std::string>{"contains", "pattern", "predicate"});
}

TEST_CASE("Unmatched line invokes nothing") {
    HandlerRegistry reg;
    reg.add_pattern(boost::regex("^TRAFFIC:"), [](const std::string&) { FAIL("should not run"); });
    CHECK(reg.dispatch("DEBUG: something else") == 0);
    CHECK(reg.dispatch("") == 0);
}

TEST_CASE("Pattern entries match anywhere and keep no state between lines") {
    HandlerRegistry reg;
    int n = 0;
    reg.add_pattern(boost::regex("key pressed: (\\w+)"), [&](const std::string&) { ++n; });

    for (int i = 0; i < 3; ++i) {
        CHECK(reg.dispatch("DEBUG: [1] key pressed: up (1)") == 1);
    }
    CHECK(n == 3);
}

TEST_CASE("Entries added during dispatch start with the next line") {
    HandlerRegistry reg;
    int late = 0;
    reg.add_contains("x", [&](const std::string&) {
        reg.add_contains("x", [&](const std::string&) { ++late; });
    });

    CHECK(reg.dispatch("x") == 1);
    CHECK(late == 0);
    CHECK(reg.dispatch("x") == 2);
    CHECK(late == 1);
}
