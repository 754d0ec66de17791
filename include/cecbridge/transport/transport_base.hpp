#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal transport interface between the Monitor and the adapter process.
 *
 * Header-only on purpose. The Monitor only ever calls send(); the host loop
 * drives begin()/recv()/end(). Tests plug in a fake that records lines.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cecbridge::transport {

// Return codes kept simple; the Monitor only needs ok/not ok.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2, Closed=3 };

struct Config {
  std::string              program{"cec-client"};  ///< adapter executable (PATH lookup)
  std::vector<std::string> args;                   ///< argv[1..]
  int                      poll_timeout_ms{100};   ///< recv() wait per call
};

/**
 * @brief Transport trait every adapter link can rely on.
 *
 * Contract:
 *  - begin(cfg) starts the link (spawns the adapter, opens the port, ...).
 *  - recv(buf,cap) waits up to cfg.poll_timeout_ms; Ok with out_len>0 on data,
 *    None on timeout, Closed once the peer has gone away for good.
 *  - send(buf,len) writes everything or reports Error; never retries forever.
 *  - end() tears the link down; safe to call twice.
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
};

} // namespace cecbridge::transport
