#include <doctest/doctest.h>
#include "cecbridge/monitor.hpp"
#include "fake_transport.hpp"

#include <string>
#include <vector>

using namespace cecbridge;
using cecbridge::test::FakeTransport;

// Records the names of every event we care about, in emission order.
struct Recorder {
    std::vector<std::string> names;
    std::vector<Event>       events;

    explicit Recorder(EventBus& bus) {
        for (const char* n : { event::READY, event::STOP, event::POLLING, event::PACKET,
                               event::SET_OSD_NAME, event::ROUTING_CHANGE, event::ACTIVE_SOURCE,
                               event::REPORT_PHYSICAL_ADDRESS, "op.STANDBY",
                               "op.REPORT_POWER_STATUS", "op.DEVICE_VENDOR_ID" }) {
            bus.on(n, [this](const Event& ev) { names.push_back(ev.name); events.push_back(ev); });
        }
    }

    const Event* find(const std::string& name) const {
        for (const auto& e : events) if (e.name == name) return &e;
        return nullptr;
    }
};

TEST_CASE("start() appends the device name and type flags to the adapter arguments") {
    FakeTransport link;
    Monitor mon(link, "Kodi", LogicalAddress::PLAYBACKDEVICE1);

    transport::Config cfg;
    cfg.program = "/usr/bin/cec-client";
    cfg.args = {"-d", "8"};
    REQUIRE(mon.start(cfg));

    CHECK(link.started.program == "/usr/bin/cec-client");
    CHECK(link.started.args == std::vector<std::string>{"-d", "8", "-o", "Kodi", "-t", "p"});
    CHECK_FALSE(mon.ready());
}

TEST_CASE("start() reports a transport that fails to begin") {
    FakeTransport link;
    link.fail_begin = true;
    Monitor mon(link);
    CHECK_FALSE(mon.start(transport::Config{}));
}

TEST_CASE("Ready marker enters the ready state; stop() leaves it") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    std::vector<std::string> data;
    mon.events().on(event::DATA, [&](const Event& ev) { data.push_back(ev.get<LineEvent>()->line); });

    const std::string out = "CEC Parser created - libCEC version 4.0.4\nwaiting for input\n";
    mon.feed(out.data(), out.size());

    CHECK(mon.ready());
    CHECK(data.size() == 2);
    CHECK(rec.names == std::vector<std::string>{"ready"});

    mon.stop();
    CHECK_FALSE(mon.ready());
    CHECK(link.end_calls == 1);
    CHECK(rec.names == std::vector<std::string>{"ready", "stop"});
}

TEST_CASE("Each ready marker line emits ready") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    mon.process_line("waiting for input");
    mon.process_line("waiting for input");

    CHECK(mon.ready());
    CHECK(rec.names == std::vector<std::string>{"ready", "ready"});
}

TEST_CASE("Broadcast STANDBY traffic emits packet then op.STANDBY") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    CHECK(mon.process_line("TRAFFIC: [18:35:40.1] << 0f:36") == 1);
    CHECK(rec.names == std::vector<std::string>{"packet", "op.STANDBY"});

    const auto* op = rec.find("op.STANDBY")->get<OperationEvent>();
    REQUIRE(op != nullptr);
    CHECK(op->opcode_name == "STANDBY");
    CHECK(op->packet.target == 0xF);
    CHECK(op->args.empty());
}

TEST_CASE("Polling lines emit polling only") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    CHECK_FALSE(mon.process_traffic("TRAFFIC: [  19401]\t>> 11"));
    CHECK(rec.names == std::vector<std::string>{"polling"});
}

TEST_CASE("Packets for other devices are dropped unless monitor mode is on") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    CHECK_FALSE(mon.process_traffic("TRAFFIC: [ 1]\t<< 05:36"));
    CHECK(rec.names.empty());

    mon.set_monitor_mode(true);
    CHECK(mon.process_traffic("TRAFFIC: [ 2]\t<< 05:36"));
    CHECK(rec.names == std::vector<std::string>{"packet", "op.STANDBY"});
}

TEST_CASE("Packets addressed to us are surfaced") {
    FakeTransport link;
    Monitor mon(link);        // RECORDINGDEVICE1 = 1
    Recorder rec(mon.events());

    CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 01:90:00"));
    CHECK(rec.names == std::vector<std::string>{"packet", "op.REPORT_POWER_STATUS"});
    const auto* op = rec.find("op.REPORT_POWER_STATUS")->get<OperationEvent>();
    REQUIRE(op->args.size() == 1);
    CHECK(op->args[0] == 0x00);
}

TEST_CASE("Semantic decoders") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    SUBCASE("SET_OSD_NAME") {
        CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 01:47:54:56"));
        const auto* e = rec.find(event::SET_OSD_NAME)->get<OsdNameEvent>();
        REQUIRE(e != nullptr);
        CHECK(std::string(e->name.c_str()) == "TV");
    }
    SUBCASE("ROUTING_CHANGE") {
        CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 0f:80:10:00:20:00"));
        const auto* e = rec.find(event::ROUTING_CHANGE)->get<RoutingChangeEvent>();
        REQUIRE(e != nullptr);
        CHECK(e->from == 0x1000);
        CHECK(e->to == 0x2000);
    }
    SUBCASE("ACTIVE_SOURCE") {
        CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 4f:82:30:00"));
        const auto* e = rec.find(event::ACTIVE_SOURCE)->get<ActiveSourceEvent>();
        REQUIRE(e != nullptr);
        CHECK(e->physical_address == 0x3000);
    }
    SUBCASE("REPORT_PHYSICAL_ADDRESS with and without device type") {
        CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 0f:84:00:00:00"));
        CHECK(mon.process_traffic("TRAFFIC: [ 2]\t>> 4f:84:21:00"));
        std::vector<const PhysicalAddressEvent*> got;
        for (const auto& ev : rec.events) {
            if (const auto* e = ev.get<PhysicalAddressEvent>()) got.push_back(e);
        }
        REQUIRE(got.size() == 2);
        CHECK(got[0]->physical_address == 0x0000);
        CHECK(got[0]->device_type == 0);
        CHECK(got[1]->physical_address == 0x2100);
        CHECK(got[1]->device_type == INVALID_BYTE);
    }
    SUBCASE("generic per-opcode event carries the raw operands") {
        CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 0f:87:00:15:82"));
        const auto* e = rec.find("op.DEVICE_VENDOR_ID")->get<OperationEvent>();
        REQUIRE(e != nullptr);
        REQUIRE(e->args.size() == 3);
        CHECK(e->args[1] == 0x15);
    }
}

TEST_CASE("Too few or invalid operands, or an unknown opcode, stop at packet") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    CHECK_FALSE(mon.process_traffic("TRAFFIC: [ 1]\t>> 0f:80:10:00"));      // ROUTING_CHANGE needs 4
    CHECK_FALSE(mon.process_traffic("TRAFFIC: [ 2]\t>> 0f:82:zz:00"));      // invalid byte
    CHECK_FALSE(mon.process_traffic("TRAFFIC: [ 3]\t>> 01:47"));            // SET_OSD_NAME, no name
    CHECK_FALSE(mon.process_traffic("TRAFFIC: [ 4]\t>> 01:01:02"));         // not an opcode
    CHECK(rec.names == std::vector<std::string>{"packet", "packet", "packet", "packet"});
}

TEST_CASE("Allocation line moves the device address; filter and tx follow it") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    CHECK_FALSE(mon.set_device_address("DEBUG: nothing to see"));
    mon.process_line("DEBUG:   [  95]\tAllocateLogicalAddresses - device '0', type 'playback device', LA '4'");
    CHECK(mon.device_address() == LogicalAddress::PLAYBACKDEVICE1);
    CHECK(mon.requested_address() == LogicalAddress::RECORDINGDEVICE1);

    CHECK(mon.process_traffic("TRAFFIC: [ 1]\t>> 04:36"));
    CHECK_FALSE(mon.process_traffic("TRAFFIC: [ 2]\t>> 01:36"));

    REQUIRE(mon.execute_operation(LogicalAddress::TV, OperationCode::GIVE_DEVICE_POWER_STATUS));
    CHECK(link.lines().back() == "tx 40:8f");
}

TEST_CASE("Outbound operations are written as tx lines") {
    FakeTransport link;
    Monitor mon(link);

    CHECK(mon.send("scan"));
    CHECK(mon.execute_operation(LogicalAddress::TV, OperationCode::GIVE_OSD_NAME));
    CHECK(mon.execute_operation_with_boolean(LogicalAddress::AUDIOSYSTEM, OperationCode::SYSTEM_AUDIO_MODE_STATUS, true));
    CHECK(mon.execute_operation_with_integer(LogicalAddress::TV, OperationCode::DEVICE_VENDOR_ID, 0x001582));
    CHECK(mon.execute_operation_with_string(LogicalAddress::TV, OperationCode::SET_OSD_NAME, "Hi"));
    CHECK(mon.execute_broadcast_operation(OperationCode::STANDBY));
    const uint8_t raw[] = {0x10, 0x04};
    CHECK(mon.send_command(raw, 2));

    CHECK(link.lines() == std::vector<std::string>{
        "scan", "tx 10:46", "tx 15:7e:1", "tx 10:87:0:15:82", "tx 10:47:48:69", "tx 1f:36", "tx 10:4"});

    link.fail_send = true;
    CHECK_FALSE(mon.execute_broadcast_operation(OperationCode::STANDBY));
    CHECK_FALSE(mon.send_command(raw, 0));
}

TEST_CASE("end_of_stream() flushes the last partial line, then stops") {
    FakeTransport link;
    Monitor mon(link);
    Recorder rec(mon.events());

    const std::string tail = "waiting for input";
    mon.feed(tail.data(), tail.size());
    CHECK_FALSE(mon.ready());

    mon.end_of_stream();
    CHECK(rec.names == std::vector<std::string>{"ready", "stop"});
    CHECK_FALSE(mon.ready());
}
