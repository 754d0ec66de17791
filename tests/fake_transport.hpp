// In-memory ITransport for tests: records what the Monitor writes, replays scripted output.
#pragma once

#include <deque>
#include <string>
#include <vector>

#include "cecbridge/transport/transport_base.hpp"

namespace cecbridge::test {

class FakeTransport : public transport::ITransport {
public:
    bool begin(const transport::Config& cfg) override {
        started = cfg;
        ++begin_calls;
        open = !fail_begin;
        return open;
    }
    void end() override { open = false; ++end_calls; }
    bool is_open() const override { return open; }

    transport::RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
        out_len = 0;
        if (inbound.empty()) return open ? transport::RxResult::None : transport::RxResult::Closed;
        std::string& chunk = inbound.front();
        out_len = chunk.size() < cap ? chunk.size() : cap;
        chunk.copy(reinterpret_cast<char*>(out), out_len);
        chunk.erase(0, out_len);
        if (chunk.empty()) inbound.pop_front();
        return transport::RxResult::Ok;
    }

    transport::TxResult send(const uint8_t* data, std::size_t len) override {
        if (fail_send) return transport::TxResult::Error;
        written.append(reinterpret_cast<const char*>(data), len);
        return transport::TxResult::Ok;
    }

    const char* name() const override { return "fake"; }

    /// Written data split into lines (terminators removed).
    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        std::size_t start = 0;
        for (std::size_t nl = written.find('\n'); nl != std::string::npos; nl = written.find('\n', start)) {
            out.push_back(written.substr(start, nl - start));
            start = nl + 1;
        }
        return out;
    }

    bool                    open{false};
    bool                    fail_begin{false};
    bool                    fail_send{false};
    int                     begin_calls{0};
    int                     end_calls{0};
    transport::Config       started;
    std::string             written;
    std::deque<std::string> inbound;
};

} // namespace cecbridge::test
