#include <doctest/doctest.h>
#include "cecbridge/remote.hpp"
#include "fake_transport.hpp"

#include <string>
#include <vector>

using namespace cecbridge;
using cecbridge::test::FakeTransport;

static std::string pressed(const std::string& key, const std::string& code) {
    return "DEBUG:   [  1234]\tkey pressed: " + key + " (" + code + ")";
}
static std::string released(const std::string& key, const std::string& code) {
    return "DEBUG:   [  1390]\tkey released: " + key + " (" + code + ")";
}

struct KeyLog {
    std::vector<std::string> seen;   // "<event>:<key>:<repeat>"

    KeyLog(Remote& remote, const std::vector<std::string>& names) {
        for (const auto& n : names) {
            remote.events().on(n, [this](const Event& ev) {
                const auto* k = ev.get<KeyEvent>();
                seen.push_back(ev.name + ":" + k->key.c_str() + ":" + (k->repeat ? "r" : "-"));
            });
        }
    }
};

static const std::vector<std::string> ALL = {"keydown", "keyup", "keypress", "keypress.up", "keypress.down"};

TEST_CASE("Press then release yields keydown, keyup, keypress, keypress.<name>") {
    FakeTransport link;
    Monitor mon(link);
    Remote remote(mon);
    KeyLog log(remote, ALL);

    mon.process_line(pressed("up", "41"));
    mon.process_line(released("up", "41"));

    CHECK(log.seen == std::vector<std::string>{
        "keydown:up:-", "keyup:up:-", "keypress:up:-", "keypress.up:up:-"});
    CHECK(remote.state().current_code == -1);
    CHECK(remote.state().previous_code == 0x41);
}

TEST_CASE("Held key repeats keydown until released") {
    FakeTransport link;
    Monitor mon(link);
    Remote remote(mon);
    KeyLog log(remote, ALL);

    mon.process_line(pressed("up", "1"));
    mon.process_line(pressed("up", "1"));
    CHECK(log.seen == std::vector<std::string>{"keydown:up:-", "keydown:up:r"});

    mon.process_line(released("up", "1"));
    CHECK(log.seen.back() == "keypress.up:up:r");
    CHECK(log.seen[log.seen.size() - 2] == "keypress:up:r");

    mon.process_line(pressed("up", "1"));     // keyup cleared the held slot
    CHECK(log.seen.back() == "keydown:up:-");
    CHECK(remote.state().previous_code == -1);
}

TEST_CASE("Separate presses of the same key are not repeats") {
    FakeTransport link;
    Monitor mon(link);
    Remote remote(mon);
    KeyLog log(remote, {"keypress"});

    mon.process_line(pressed("down", "2"));
    mon.process_line(released("down", "2"));
    mon.process_line(pressed("down", "2"));
    mon.process_line(released("down", "2"));
    mon.process_line(pressed("up", "1"));
    mon.process_line(released("up", "1"));

    CHECK(log.seen == std::vector<std::string>{"keypress:down:-", "keypress:down:-", "keypress:up:-"});
}

TEST_CASE("Release that does not match the held key yields keyup only") {
    FakeTransport link;
    Monitor mon(link);
    Remote remote(mon);
    KeyLog log(remote, ALL);

    mon.process_line(released("up", "1"));                  // never pressed
    mon.process_line(pressed("down", "2"));
    mon.process_line(released("up", "1"));                  // out of order

    CHECK(log.seen == std::vector<std::string>{"keyup:up:-", "keydown:down:-", "keyup:up:-"});
    CHECK(remote.state().current_code == 2);
}

TEST_CASE("Key lines are parsed statelessly; other lines are ignored") {
    KeyNameStr name;
    int code = -1;

    CHECK(Remote::parse_key_line(pressed("F1 (blue)", "71"), true, name, code));
    CHECK(std::string(name.c_str()) == "F1 (blue)");
    CHECK(code == 0x71);

    CHECK(Remote::parse_key_line(pressed("select", "0"), true, name, code));
    CHECK(Remote::parse_key_line(pressed("select", "0"), true, name, code));   // same result again
    CHECK(code == 0);

    CHECK_FALSE(Remote::parse_key_line(pressed("up", "1"), false, name, code));
    CHECK_FALSE(Remote::parse_key_line("TRAFFIC: [ 1]\t>> 01:44:01", true, name, code));
    CHECK_FALSE(Remote::parse_key_line("key pressed: up (1)", true, name, code));  // no DEBUG prefix
}

TEST_CASE("Key lines reach the Remote through the shared registry") {
    FakeTransport link;
    Monitor mon(link);
    const size_t before = mon.handlers().size();
    Remote remote(mon);
    CHECK(mon.handlers().size() == before + 2);

    int downs = 0;
    remote.events().on(event::KEYDOWN, [&](const Event&) { ++downs; });
    const std::string chunked = pressed("up", "1") + "\n";
    mon.feed(chunked.data(), 10);
    mon.feed(chunked.data() + 10, chunked.size() - 10);
    CHECK(downs == 1);
}
