#pragma once
#include "etherstream/core/Expected.hpp"
#include "etherstream/core/Sample.hpp"
#include "etherstream/net/NetConfig.hpp"
#include "etherstream/net/TcpClient.hpp"
#include "etherstream/etherdream/EtherDreamConfig.hpp"
#include "etherstream/etherdream/EtherDreamCommand.hpp"
#include "etherstream/etherdream/EtherDreamError.hpp"
#include "etherstream/etherdream/EtherDreamResponse.hpp"
#include "etherstream/etherdream/ResponseDemux.hpp"
#include "etherstream/etherdream/SessionState.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace etherstream::etherdream {

namespace ip = etherstream::net::asio::ip;

/**
 * @brief One TCP conversation with an EtherDream DAC.
 *
 * Each command writes its packet, then blocks the calling thread until the
 * matching 22-byte status reply arrives. Meanwhile the network thread keeps
 * reading the socket and feeding the response demultiplexer, so replies that
 * arrive split or coalesced are still paired with their requests in order.
 *
 * Every reply updates the session state (see SessionState). Commands are
 * serialized: only one request is outstanding at a time.
 *
 * close() may be called from any thread; a command blocked on a reply then
 * returns SessionErrc::Disconnected.
 */
class EtherDreamSession {
public:
    struct DacAck {
        EtherDreamStatus status{};
        char command = 0;
    };

    EtherDreamSession();
    ~EtherDreamSession();

    EtherDreamSession(const EtherDreamSession&) = delete;
    EtherDreamSession& operator=(const EtherDreamSession&) = delete;
    EtherDreamSession(EtherDreamSession&&) = delete;
    EtherDreamSession& operator=(EtherDreamSession&&) = delete;

    /**
     * @brief Open the connection and wait for the DAC's greeting status.
     *
     * Transport failures are returned, never thrown, so callers can retry.
     * @param host Dotted quad or host name.
     * @param port EtherDream TCP port (defaults to 7765).
     */
    expected<void> connect(const std::string& host,
                           unsigned short port = config::ETHERDREAM_DAC_PORT_DEFAULT);

    expected<void> connect(const ip::address& address,
                           unsigned short port = config::ETHERDREAM_DAC_PORT_DEFAULT);

    /// Close and connect again to the last address passed to connect().
    expected<void> reconnect();

    /// Drop the connection, queued bytes and pending replies. Idempotent.
    void close();

    bool isConnected() const;
    bool hasRememberedAddress() const;

    expected<DacAck> ping();
    expected<DacAck> prepare();
    expected<DacAck> begin(std::uint32_t pointRate);
    expected<DacAck> update(std::uint32_t pointRate);
    expected<DacAck> stop();
    expected<DacAck> emergencyStop();
    expected<DacAck> clearEmergencyStop();

    /// Send one data command. At most 65535 samples; keep batches within
    /// the device buffer capacity.
    expected<DacAck> writeSamples(const core::Sample* samples, std::size_t count);
    expected<DacAck> writeSamples(const core::Frame& samples) {
        return writeSamples(samples.data(), samples.size());
    }

    /// Snapshot of the current state.
    SessionState state() const;

    /// Zero (the default) waits for replies indefinitely.
    void setResponseTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds responseTimeout() const;

    /// Deadline for connect and writes (see net::TimeoutConfig).
    void setTransportTimeout(std::chrono::milliseconds timeout);

private:
    using PendingAck = std::future<expected<DacAck>>;

    expected<void> connectEndpoints(std::vector<net::tcp::endpoint> endpoints);
    expected<DacAck> sendSingleByte(char code);
    expected<DacAck> sendRate(char code, std::uint32_t pointRate);
    expected<DacAck> transact();

    PendingAck expectResponse(char command, bool checkEcho = true);
    // A zero timeout waits indefinitely.
    expected<DacAck> awaitResponse(char command, PendingAck& pending,
                                   std::chrono::milliseconds timeout);
    expected<DacAck> handleResponse(char command, bool checkEcho,
                                    const ResponseDemux::Bytes& raw);
    void handleTransportError(const std::error_code& ec);
    void resetConnection();

    mutable std::mutex commandMutex;
    mutable std::mutex stateMutex;
    SessionState sessionState{};
    std::atomic<bool> linkLost{false};
    std::atomic<long long> responseTimeoutMs{0};
    std::vector<net::tcp::endpoint> rememberedEndpoints;

    ResponseDemux demux;
    EtherDreamCommand commandBuffer;
    net::TcpClient tcpClient;
};

/// Printable name of an opcode for log lines ("0xFF" for emergency stop).
std::string describeOpcode(char opcode);

} // namespace etherstream::etherdream
