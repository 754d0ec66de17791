#include <doctest/doctest.h>
#include "cecbridge/logical_address.hpp"
#include "cecbridge/opcode.hpp"
#include "cecbridge/power_status.hpp"
#include "cecbridge/user_control.hpp"

#include <string>

using namespace cecbridge;

TEST_CASE("Logical addresses: names, parsing, adapter type flag") {
    CHECK(std::string(logical_address_name(LogicalAddress::TV)) == "TV");
    CHECK(std::string(logical_address_name(LogicalAddress::BROADCAST)) == "BROADCAST");
    CHECK(to_int(LogicalAddress::UNREGISTERED) == to_int(LogicalAddress::BROADCAST));
    CHECK(logical_address_from_int(4) == LogicalAddress::PLAYBACKDEVICE1);
    CHECK(logical_address_from_int(16) == LogicalAddress::UNKNOWN);

    LogicalAddress a = LogicalAddress::TV;
    CHECK(parse_logical_address("audiosystem", a));
    CHECK(a == LogicalAddress::AUDIOSYSTEM);
    CHECK(parse_logical_address("0xb", a));
    CHECK(a == LogicalAddress::PLAYBACKDEVICE3);
    CHECK(parse_logical_address("UNREGISTERED", a));
    CHECK(to_int(a) == 15);
    CHECK_FALSE(parse_logical_address("16", a));
    CHECK(parse_logical_address("010", a));         // leading zero is still decimal
    CHECK(a == LogicalAddress::TUNER4);
    CHECK(parse_logical_address("08", a));
    CHECK(a == LogicalAddress::PLAYBACKDEVICE2);
    CHECK(parse_logical_address("0XF", a));
    CHECK(to_int(a) == 15);
    CHECK_FALSE(parse_logical_address("0x", a));
    CHECK_FALSE(parse_logical_address(" 4", a));
    CHECK_FALSE(parse_logical_address("-1", a));
    CHECK_FALSE(parse_logical_address("couch", a));

    CHECK(client_type_for(LogicalAddress::AUDIOSYSTEM) == 'a');
    CHECK(client_type_for(LogicalAddress::PLAYBACKDEVICE2) == 'p');
    CHECK(client_type_for(LogicalAddress::TUNER3) == 't');
    CHECK(client_type_for(LogicalAddress::RECORDINGDEVICE1) == 'r');
    CHECK(client_type_for(LogicalAddress::TV) == 'r');
}

TEST_CASE("Opcode table maps both ways") {
    CHECK(std::string(opcode_name(0x36)) == "STANDBY");
    CHECK(std::string(opcode_name(OperationCode::REPORT_POWER_STATUS)) == "REPORT_POWER_STATUS");
    CHECK(opcode_name(0x01) == nullptr);
    CHECK(opcode_name(-1) == nullptr);
    CHECK(opcode_name(0x100) == nullptr);
    CHECK(is_known_opcode(0xFF));
    CHECK_FALSE(is_known_opcode(0x01));
    CHECK(opcode_event_name(OperationCode::CEC_VERSION) == "op.CEC_VERSION");

    OperationCode op = OperationCode::ABORT;
    CHECK(parse_opcode("GIVE_OSD_NAME", op));
    CHECK(op == OperationCode::GIVE_OSD_NAME);
    CHECK(parse_opcode("0x8f", op));
    CHECK(op == OperationCode::GIVE_DEVICE_POWER_STATUS);
    CHECK_FALSE(parse_opcode("0x01", op));
    CHECK(parse_opcode("054", op));                 // 54 decimal = 0x36
    CHECK(op == OperationCode::STANDBY);
}

TEST_CASE("Power status and remote buttons") {
    CHECK(power_status_from_int(1) == PowerStatus::STANDBY);
    CHECK(power_status_from_int(9) == PowerStatus::UNKNOWN);
    CHECK(std::string(power_status_name(PowerStatus::ON)) == "on");

    UserControlButton b = UserControlButton::SELECT;
    CHECK(parse_user_control("volume_up", b));
    CHECK(b == UserControlButton::VOLUME_UP);
    CHECK(parse_user_control("0x01", b));
    CHECK(b == UserControlButton::UP);
    CHECK_FALSE(parse_user_control("TELEPORT", b));
    CHECK(parse_user_control("065", b));            // 65 decimal = 0x41
    CHECK(b == UserControlButton::VOLUME_UP);
    CHECK(std::string(user_control_name(0x41)) == "VOLUME_UP");
}
