/**
 * @file packet.hpp
 * @brief CEC packet codec - adapter traffic text in, `tx` command text out.
 *
 * @details
 * ## Inbound
 * The adapter reports every frame it sees on the bus as a diagnostic line:
 * ```
 *   TRAFFIC: [           22588]\t<< 10:47:63:65:63
 *            ^ timestamp bracket  ^^ direction  ^ header:opcode:operands...
 * ```
 * `decode_traffic()` throws away the metadata in front of the hex tail and
 * splits the tail on ':' into tokens. Token 0 is the header block (high nibble
 * source, low nibble target), token 1 the opcode, tokens 2.. the operands.
 * A header-only frame is a **polling** message (address presence check).
 *
 * Decoding is permissive. A token that is not a hex byte becomes
 * `INVALID_BYTE` and decoding goes on; downstream decoders decide whether they
 * can live with the gap (see Monitor).
 *
 * ## Outbound
 * The adapter accepts `tx <src><dst>:<opcode>[:<operand>...]` on stdin.
 * Components are lower-case hex without zero padding ("tx 10:4", not
 * "tx 10:04"); the adapter parses them either way.
 *
 * ## Capacities
 * A CEC frame holds at most 16 blocks (header + opcode + 14 operands). The
 * containers below are fixed-capacity ETL types sized to that; surplus tokens
 * on a garbage line are dropped, over-long tokens truncated.
 */
#ifndef CECBRIDGE_PACKET_HPP
#define CECBRIDGE_PACKET_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "etl/string.h"
#include "etl/vector.h"
#include "cecbridge/logical_address.hpp"
#include "cecbridge/opcode.hpp"

namespace cecbridge {

static constexpr size_t  MAX_FRAME_BLOCKS = 16;  ///< header + opcode + operands
static constexpr size_t  MAX_OPERANDS     = 14;
static constexpr int16_t INVALID_BYTE     = -1;  ///< decoded value of a non-hex token

using TokenStr     = etl::string<8>;
using PacketTokens = etl::vector<TokenStr, MAX_FRAME_BLOCKS>;
using ArgBytes     = etl::vector<int16_t, MAX_OPERANDS>;  ///< decoded operands, may hold INVALID_BYTE
using ParamBytes   = etl::vector<uint8_t, MAX_OPERANDS>;  ///< outbound operands
using OsdNameStr   = etl::string<MAX_OPERANDS>;

/**
 * @brief One decoded traffic line.
 *
 * - `tokens` always holds at least one entry (possibly empty string).
 * - `source`/`target` stay 0 when tokens[0] is shorter than two characters.
 * - `opcode`/`args` are meaningful only when `tokens.size() > 1`.
 */
struct ParsedPacket {
  PacketTokens tokens;
  int16_t      source{0};
  int16_t      target{0};
  int16_t      opcode{0};
  ArgBytes     args;

  /// Header-only frame (no opcode).
  bool is_polling() const { return tokens.size() <= 1; }

  /// True if any of the first @p count operands is INVALID_BYTE or missing.
  bool has_invalid_args(size_t count) const;
};

// ---------- decode ----------

/**
 * @brief Decode one adapter traffic line.
 *
 * Steps: cut at the `]\t` marker (first `]` if the adapter used spaces),
 * skip whitespace, drop the direction arrow up to the first space, split on
 * ':'. Never fails; see ParsedPacket for which fields are meaningful.
 */
ParsedPacket decode_traffic(const std::string& line);

/**
 * @brief Parse one hex token ("0f", "A", " 36 ") into a byte.
 * @return 0..255, or INVALID_BYTE for empty, non-hex, or > 0xFF input.
 */
int16_t parse_hex_byte(const char* s, size_t n);

/// Big-endian 16-bit value from args[at], args[at+1]. Caller checks bounds.
uint16_t decode_be16(const ArgBytes& args, size_t at);

/// Operands as characters (SET_OSD_NAME payload). INVALID_BYTE entries are skipped.
OsdNameStr decode_osd_name(const ArgBytes& args);

/// Single-line summary for logs: "src=1 dst=0 op=0x90(REPORT_POWER_STATUS) args=[01]".
std::string describe_packet(const ParsedPacket& p);

// ---------- encode ----------

/**
 * @brief Format a `tx` line for one operation.
 *
 * Addresses are masked to one nibble each. No trailing newline; the
 * transport layer owns line termination.
 */
std::string encode_operation(LogicalAddress source, LogicalAddress target,
                             OperationCode opcode,
                             const ParamBytes& params = ParamBytes());

/// encode_operation() with target fixed to BROADCAST.
std::string encode_broadcast(LogicalAddress source, OperationCode opcode,
                             const ParamBytes& params = ParamBytes());

/// Raw `tx` line from explicit blocks (caller supplies the header byte).
std::string encode_command(const uint8_t* blocks, size_t n);

/// One operand: 0x01 for true, 0x00 for false.
ParamBytes encode_boolean_param(bool value);

/**
 * @brief Exactly three big-endian operand bytes.
 *
 * Bits above 2^24-1 are dropped: 0x1000000 encodes like 0.
 */
ParamBytes encode_integer_param(uint32_t value);

/**
 * @brief One operand per byte of @p value.
 *
 * The string is taken byte-wise: a multi-byte UTF-8 sequence becomes its raw
 * bytes, not one code point. Output stops at MAX_OPERANDS bytes.
 */
ParamBytes encode_string_param(const std::string& value);

} // namespace cecbridge

#endif // CECBRIDGE_PACKET_HPP
