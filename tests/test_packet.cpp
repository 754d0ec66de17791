#include <doctest/doctest.h>
#include "cecbridge/packet.hpp"

#include <string>

using namespace cecbridge;

static std::string tok(const ParsedPacket& p, size_t i) { return p.tokens[i].c_str(); }

TEST_CASE("Traffic line with tab marker decodes header, opcode and args") {
    const auto p = decode_traffic("TRAFFIC: [  22588]\t<< 10:90:01");
    REQUIRE(p.tokens.size() == 3);
    CHECK(tok(p, 0) == "10");
    CHECK(p.source == 1);
    CHECK(p.target == 0);
    CHECK(p.opcode == 0x90);
    REQUIRE(p.args.size() == 1);
    CHECK(p.args[0] == 0x01);
    CHECK_FALSE(p.is_polling());
}

TEST_CASE("Space-separated timestamp marker is accepted too") {
    const auto p = decode_traffic("TRAFFIC: [18:35:40.1] << 0f:36");
    CHECK(p.source == 0x0);
    CHECK(p.target == 0xF);
    CHECK(p.opcode == 0x36);
    CHECK(p.args.empty());
}

TEST_CASE("Header-only line is a polling message") {
    const auto p = decode_traffic("TRAFFIC: [  19401]\t>> 1f");
    CHECK(p.is_polling());
    REQUIRE(p.tokens.size() == 1);
    CHECK(p.source == 1);
    CHECK(p.target == 0xF);
}

TEST_CASE("Header shorter than two characters keeps default addresses") {
    const auto p = decode_traffic("TRAFFIC: [  1]\t<< 4:87:00:0c:03");
    CHECK(p.source == 0);
    CHECK(p.target == 0);
    CHECK(p.opcode == 0x87);
    REQUIRE(p.args.size() == 3);
    CHECK(p.args[2] == 0x03);
}

TEST_CASE("Non-hex tokens decode to INVALID_BYTE without stopping the line") {
    const auto p = decode_traffic("TRAFFIC: [  2]\t<< 40:84:zz:00:04");
    CHECK(p.opcode == 0x84);
    REQUIRE(p.args.size() == 3);
    CHECK(p.args[0] == INVALID_BYTE);
    CHECK(p.args[1] == 0x00);
    CHECK(p.args[2] == 0x04);
    CHECK(p.has_invalid_args(1));
    CHECK(p.has_invalid_args(4));   // too few
    CHECK(decode_traffic("TRAFFIC: [  2]\t<< x0:36").source == INVALID_BYTE);
}

TEST_CASE("parse_hex_byte accepts one byte of hex only") {
    CHECK(parse_hex_byte("0a", 2) == 0x0A);
    CHECK(parse_hex_byte(" FF ", 4) == 0xFF);
    CHECK(parse_hex_byte("1ff", 3) == INVALID_BYTE);
    CHECK(parse_hex_byte("g1", 2) == INVALID_BYTE);
    CHECK(parse_hex_byte("", 0) == INVALID_BYTE);
}

TEST_CASE("Encoded operation decodes back to the same target, opcode and args") {
    ParamBytes params;
    params.push_back(0xAB);
    params.push_back(0x01);
    params.push_back(0x0C);

    const std::string wire = encode_operation(LogicalAddress::RECORDINGDEVICE1, LogicalAddress::TV,
                                              OperationCode::REPORT_POWER_STATUS, params);
    CHECK(wire == "tx 10:90:ab:1:c");

    const auto p = decode_traffic(wire);
    CHECK(p.source == 1);
    CHECK(p.target == 0);
    CHECK(p.opcode == 0x90);
    REQUIRE(p.args.size() == 3);
    CHECK(p.args[0] == 0xAB);
    CHECK(p.args[1] == 0x01);
    CHECK(p.args[2] == 0x0C);
}

TEST_CASE("Broadcast and raw command encodings") {
    CHECK(encode_broadcast(LogicalAddress::PLAYBACKDEVICE1, OperationCode::STANDBY) == "tx 4f:36");
    CHECK(encode_operation(LogicalAddress::TV, LogicalAddress::TV, OperationCode::FEATURE_ABORT) == "tx 00:0");

    const uint8_t blocks[] = {0x0F, 0x36};
    CHECK(encode_command(blocks, 2) == "tx 0f:36");
    const uint8_t with_arg[] = {0x10, 0x44, 0x01};
    CHECK(encode_command(with_arg, 3) == "tx 10:44:1");
}

TEST_CASE("Integer params are always three big-endian bytes") {
    const auto v = encode_integer_param(0x123456);
    REQUIRE(v.size() == 3);
    CHECK(v[0] == 0x12);
    CHECK(v[1] == 0x34);
    CHECK(v[2] == 0x56);

    CHECK(encode_integer_param(0x1000000) == encode_integer_param(0));
    CHECK(encode_integer_param(7).size() == 3);
}

TEST_CASE("Boolean and string params") {
    REQUIRE(encode_boolean_param(true).size() == 1);
    CHECK(encode_boolean_param(true)[0] == 1);
    CHECK(encode_boolean_param(false)[0] == 0);

    const auto s = encode_string_param("TV");
    REQUIRE(s.size() == 2);
    CHECK(s[0] == 'T');
    CHECK(s[1] == 'V');
    CHECK(encode_string_param("a name well over fourteen").size() == MAX_OPERANDS);
}

TEST_CASE("Operand helpers") {
    const auto p = decode_traffic("TRAFFIC: [  5]\t<< 4f:84:10:00:04");
    CHECK(decode_be16(p.args, 0) == 0x1000);

    const auto named = decode_traffic("TRAFFIC: [  6]\t<< 01:47:54:56:zz:21");
    CHECK(std::string(decode_osd_name(named.args).c_str()) == "TV!");

    CHECK(describe_packet(decode_traffic("TRAFFIC: [ 7]\t<< 10:90:01")) ==
          "src=1 dst=0 op=0x90(REPORT_POWER_STATUS) args=[01]");
    CHECK(describe_packet(decode_traffic("TRAFFIC: [ 8]\t<< 1f")) == "src=1 dst=f polling");
}
