#include <doctest/doctest.h>
#include "cecbridge/event_json.hpp"

#include <string>

using namespace cecbridge;

TEST_CASE("Packet renders with names and null for invalid operands") {
    const auto j = packet_to_json(decode_traffic("TRAFFIC: [ 1]\t>> 01:90:zz"));
    CHECK(j["source"] == 0);
    CHECK(j["target"] == 1);
    CHECK(j["opcode"] == 0x90);
    CHECK(j["opcode_name"] == "REPORT_POWER_STATUS");
    REQUIRE(j["args"].size() == 1);
    CHECK(j["args"][0].is_null());
    CHECK(j["tokens"][2] == "zz");
}

TEST_CASE("Polling packet has no opcode fields") {
    const auto j = packet_to_json(decode_traffic("TRAFFIC: [ 1]\t>> 11"));
    CHECK_FALSE(j.contains("opcode"));
    CHECK(j["tokens"].size() == 1);
}

TEST_CASE("Events carry their name and payload fields") {
    const auto pkt = decode_traffic("TRAFFIC: [ 1]\t>> 0f:80:10:00:20:00");
    const Event routing{event::ROUTING_CHANGE, RoutingChangeEvent{pkt, 0x1000, 0x2000}};
    const auto j = event_to_json(routing);
    CHECK(j["event"] == "ROUTING_CHANGE");
    CHECK(j["from"] == "1.0.0.0");
    CHECK(j["to"] == "2.0.0.0");
    CHECK(j["packet"]["opcode_name"] == "ROUTING_CHANGE");

    KeyEvent k;
    k.key = "up";
    k.key_code = 1;
    k.repeat = true;
    const auto kj = event_to_json(Event{"keypress", k});
    CHECK(kj["key"] == "up");
    CHECK(kj["key_code"] == 1);
    CHECK(kj["repeat"] == true);

    CHECK(event_to_json(Event{"ready", std::monostate{}}).size() == 1);
}

TEST_CASE("Text rendering is one key=value line") {
    KeyEvent k;
    k.key = "select";
    k.key_code = 0;
    CHECK(event_to_text(Event{"keydown", k}) == "event=keydown key=select code=0 repeat=false");

    const auto pkt = decode_traffic("TRAFFIC: [ 1]\t>> 01:47:54:56");
    OsdNameEvent osd{pkt, decode_osd_name(pkt.args)};
    CHECK(event_to_text(Event{event::SET_OSD_NAME, osd}) == "event=SET_OSD_NAME name=\"TV\"");

    CHECK(event_to_text(Event{event::PACKET, PacketEvent{pkt}}) ==
          "event=packet src=0 dst=1 op=0x47(SET_OSD_NAME) args=[54 56]");
    CHECK(event_to_text(Event{"stop", std::monostate{}}) == "event=stop");
}

TEST_CASE("Latin-1 OSD names and stray bytes still render as JSON text") {
    const auto pkt = decode_traffic("TRAFFIC: [ 1]\t<< 0f:47:e9");
    OsdNameEvent osd{pkt, decode_osd_name(pkt.args)};
    REQUIRE(std::string(osd.name.c_str()) == "\xE9");

    std::string text;
    CHECK_NOTHROW(text = to_json_text(event_to_json(Event{event::SET_OSD_NAME, osd})));
    CHECK(text.find("\"name\":\"\xEF\xBF\xBD\"") != std::string::npos);

    const auto junk = decode_traffic("TRAFFIC: [ 1]\t>> 01:90:\xFF\xFE");
    CHECK_NOTHROW(text = to_json_text(event_to_json(Event{event::PACKET, PacketEvent{junk}})));
    CHECK(text.find("\"args\":[null]") != std::string::npos);
    CHECK(text.find("\xEF\xBF\xBD") != std::string::npos);
}
