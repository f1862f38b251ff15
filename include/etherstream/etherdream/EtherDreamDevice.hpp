#pragma once
#include "etherstream/core/Expected.hpp"
#include "etherstream/core/LaserDeviceBase.hpp"
#include "etherstream/etherdream/EtherDreamConfig.hpp"
#include "etherstream/etherdream/EtherDreamSession.hpp"
#include "etherstream/etherdream/SessionState.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace etherstream::etherdream {

/**
 * @brief Streaming controller that talks to an EtherDream DAC.
 *
 * The device inherits the worker thread, the frame source and the point rate
 * from `LaserDeviceBase` and owns one `EtherDreamSession`. Once started, the
 * worker repeatedly pulls a frame, sizes a batch from the last reported buffer
 * fullness, and sends it, issuing prepare/begin whenever the reported
 * playback state asks for them.
 *
 * NAKs are logged and streaming carries on. Any other failure stops the
 * worker and is kept in lastError() until clearError() or a new connection.
 */
class EtherDreamDevice : public core::LaserDeviceBase {
public:
    EtherDreamDevice();
    ~EtherDreamDevice() override;

    // non-copyable / non-movable
    EtherDreamDevice(const EtherDreamDevice&) = delete;
    EtherDreamDevice& operator=(const EtherDreamDevice&) = delete;
    EtherDreamDevice(EtherDreamDevice&&) = delete;
    EtherDreamDevice& operator=(EtherDreamDevice&&) = delete;

    /**
     * @brief Connect to the DAC by host name or dotted quad.
     * @param host Target host.
     * @param port EtherDream TCP port (defaults to 7765).
     */
    expected<void>
    connect(const std::string& host,
            unsigned short port = config::ETHERDREAM_DAC_PORT_DEFAULT);

    expected<void>
    connect(const ip::address& address,
            unsigned short port = config::ETHERDREAM_DAC_PORT_DEFAULT);

    /// Stop streaming and drop the connection. Rate and source are kept.
    void close();

    /// Reconnect to the last address; resumes streaming if it was running.
    expected<void> reconnect();

    bool isConnected() const { return session.isConnected(); }

    SessionState sessionState() const { return session.state(); }

    /// The failure that stopped the worker, if any.
    std::optional<std::error_code> lastError() const;
    void clearError();

    EtherDreamSession& getSession() { return session; }

protected:
    void run() override;

private:
    /// Returns false when the loop must stop.
    bool check(std::string_view what, const expected<EtherDreamSession::DacAck>& ack);
    void handleFailure(std::string_view where, const std::error_code& ec);

    EtherDreamSession session;

    mutable std::mutex errorMutex;
    std::optional<std::error_code> failure{};
};

} // namespace etherstream::etherdream
