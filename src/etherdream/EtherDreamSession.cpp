/**
 * @brief Implements the EtherDream command/response session.
 */
#include "etherstream/etherdream/EtherDreamSession.hpp"

#include "etherstream/log/Log.hpp"
#include "etherstream/net/Resolve.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace etherstream::etherdream {

using DacAck = EtherDreamSession::DacAck;
namespace asio = etherstream::net::asio;

std::string describeOpcode(char opcode) {
    const auto value = static_cast<unsigned char>(opcode);
    if (value >= 0x20 && value < 0x7F) {
        return std::string(1, opcode);
    }
    std::ostringstream os;
    os << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
       << static_cast<int>(value);
    return os.str();
}

EtherDreamSession::EtherDreamSession() = default;

EtherDreamSession::~EtherDreamSession() {
    close();
}

expected<void>
EtherDreamSession::connect(const std::string& host, unsigned short port) {
    std::vector<net::tcp::endpoint> endpoints;
    if (auto ec = net::resolve(*net::shared_io_context(), host, port, endpoints); ec) {
        logError("[EtherDreamSession] cannot resolve '", host, "': ", ec.message(), "\n");
        return unexpected(ec);
    }
    return connectEndpoints(std::move(endpoints));
}

expected<void>
EtherDreamSession::connect(const ip::address& address, unsigned short port) {
    return connectEndpoints({net::tcp::endpoint(address, port)});
}

expected<void> EtherDreamSession::reconnect() {
    std::vector<net::tcp::endpoint> endpoints;
    {
        std::lock_guard lock(commandMutex);
        endpoints = rememberedEndpoints;
    }
    if (endpoints.empty()) {
        logError("[EtherDreamSession] reconnect() called before connect()\n");
        return unexpected_code(SessionErrc::NoRememberedAddress);
    }
    logInfo("[EtherDreamSession] reconnecting\n");
    return connectEndpoints(std::move(endpoints));
}

expected<void>
EtherDreamSession::connectEndpoints(std::vector<net::tcp::endpoint> endpoints) {
    std::lock_guard lock(commandMutex);

    resetConnection();
    rememberedEndpoints = endpoints;

    if (auto ec = tcpClient.connect(endpoints); ec) {
        logError("[EtherDreamSession] connect failed: ", ec.message(),
                 " (to ", endpoints.empty() ? std::string("<none>") : endpoints.front().address().to_string(),
                 ":", endpoints.empty() ? 0 : endpoints.front().port(), ")",
                 " timeout=", tcpClient.connectTimeout().count(), "ms\n");
        resetConnection();
        return unexpected(ec);
    }

    tcpClient.setLowLatency(); // Enable low jitter for realtime-ish streams.

    {
        std::lock_guard stateLock(stateMutex);
        sessionState = sessionState.onConnected();
    }

    tcpClient.startReceiving(
        [this](const std::uint8_t* data, std::size_t size) { demux.feed(data, size); },
        [this](const std::error_code& ec) { handleTransportError(ec); });

    // The DAC volunteers a status frame as soon as the connection is up.
    // Bounded by the connect deadline so a silent peer cannot stall connect().
    auto greeting = expectResponse(opcode::Ping, false);
    auto ack = awaitResponse(opcode::Ping, greeting, tcpClient.connectTimeout());
    if (!ack && ack.error() != SessionErrc::InvalidResponse) {
        logError("[EtherDreamSession] no greeting from DAC: ", ack.error().message(), "\n");
        resetConnection();
        return unexpected(ack.error());
    }

    logInfo("[EtherDreamSession] connected | ", state().lastStatus().describe(), "\n");
    return {};
}

void EtherDreamSession::close() {
    if (!tcpClient.is_open() && !state().connected()) {
        return;
    }
    logInfo("[EtherDreamSession] close()\n");
    resetConnection();
}

void EtherDreamSession::resetConnection() {
    // Socket first: once it is closed no receive handler can run, so the
    // state reset below cannot be overwritten by a late reply.
    tcpClient.close();
    demux.reset();
    linkLost = false;
    std::lock_guard lock(stateMutex);
    sessionState = sessionState.onDisconnected();
}

bool EtherDreamSession::isConnected() const {
    return tcpClient.is_open() && !linkLost.load();
}

bool EtherDreamSession::hasRememberedAddress() const {
    std::lock_guard lock(commandMutex);
    return !rememberedEndpoints.empty();
}

SessionState EtherDreamSession::state() const {
    std::lock_guard lock(stateMutex);
    return sessionState;
}

void EtherDreamSession::setResponseTimeout(std::chrono::milliseconds timeout) {
    responseTimeoutMs = timeout.count() < 0 ? 0 : timeout.count();
}

std::chrono::milliseconds EtherDreamSession::responseTimeout() const {
    return std::chrono::milliseconds{responseTimeoutMs.load()};
}

void EtherDreamSession::setTransportTimeout(std::chrono::milliseconds timeout) {
    tcpClient.setDefaultTimeout(timeout);
    tcpClient.setConnectTimeout(timeout);
}

expected<DacAck> EtherDreamSession::ping() {
    return sendSingleByte(opcode::Ping);
}

expected<DacAck> EtherDreamSession::prepare() {
    return sendSingleByte(opcode::Prepare);
}

expected<DacAck> EtherDreamSession::stop() {
    return sendSingleByte(opcode::Stop);
}

expected<DacAck> EtherDreamSession::emergencyStop() {
    return sendSingleByte(opcode::EmergencyStop);
}

expected<DacAck> EtherDreamSession::clearEmergencyStop() {
    return sendSingleByte(opcode::ClearEmergencyStop);
}

expected<DacAck> EtherDreamSession::begin(std::uint32_t pointRate) {
    return sendRate(opcode::Begin, pointRate);
}

expected<DacAck> EtherDreamSession::update(std::uint32_t pointRate) {
    return sendRate(opcode::Update, pointRate);
}

expected<DacAck> EtherDreamSession::sendSingleByte(char code) {
    std::lock_guard lock(commandMutex);
    commandBuffer.setSingleByteCommand(code);
    return transact();
}

expected<DacAck> EtherDreamSession::sendRate(char code, std::uint32_t pointRate) {
    if (pointRate == 0) {
        logError("[EtherDreamSession] '", describeOpcode(code),
                 "' needs a point rate; configure one before streaming\n");
        return unexpected_code(SessionErrc::NoPointRate);
    }

    std::lock_guard lock(commandMutex);
    logInfo("[EtherDreamSession] TX '", describeOpcode(code), "' (rate=", pointRate, ")\n");
    if (code == opcode::Update) {
        commandBuffer.setUpdateCommand(pointRate);
    } else {
        commandBuffer.setBeginCommand(pointRate);
    }
    return transact();
}

expected<DacAck>
EtherDreamSession::writeSamples(const core::Sample* samples, std::size_t count) {
    if (count > config::ETHERDREAM_MAX_BATCH) {
        logError("[EtherDreamSession] refusing data command with ", count, " samples\n");
        return unexpected_code(SessionErrc::BatchTooLarge);
    }

    std::lock_guard lock(commandMutex);
    commandBuffer.setDataCommand(samples, count);
    logInfo("[EtherDreamSession] TX data: points=", count,
            " bytes=", commandBuffer.size(), "\n");
    return transact();
}

expected<DacAck> EtherDreamSession::transact() {
    const char code = commandBuffer.opcode();

    if (!isConnected()) {
        commandBuffer.reset();
        return unexpected_code(SessionErrc::NotConnected);
    }

    if (auto ec = tcpClient.write_all(commandBuffer.data(), commandBuffer.size()); ec) {
        logError("[EtherDreamSession] TX '", describeOpcode(code), "' failed: ",
                 ec.message(), "\n");
        commandBuffer.reset();
        return unexpected(ec);
    }
    commandBuffer.reset();

    auto pending = expectResponse(code);
    return awaitResponse(code, pending, responseTimeout());
}

EtherDreamSession::PendingAck
EtherDreamSession::expectResponse(char command, bool checkEcho) {
    return demux.request(command, config::ETHERDREAM_RESPONSE_SIZE,
        [this, command, checkEcho](const ResponseDemux::Bytes& raw) {
            return handleResponse(command, checkEcho, raw);
        });
}

expected<DacAck>
EtherDreamSession::awaitResponse(char command, PendingAck& pending,
                                 std::chrono::milliseconds timeout) {
    // close() may have raced the registration above; its reset would then
    // have missed our slot.
    if (!isConnected()) {
        return unexpected_code(SessionErrc::Disconnected);
    }

    try {
        if (timeout.count() > 0 &&
            pending.wait_for(timeout) == std::future_status::timeout) {
            logError("[EtherDreamSession] no reply to '", describeOpcode(command),
                     "' after ", timeout.count(), "ms; reconnect required\n");
            std::lock_guard lock(stateMutex);
            sessionState = sessionState.onInvalidated();
            return unexpected_code(SessionErrc::ResponseTimeout);
        }
        return pending.get();
    } catch (const std::future_error&) {
        // The demux was reset before our reply arrived.
        return unexpected_code(SessionErrc::Disconnected);
    }
}

expected<DacAck>
EtherDreamSession::handleResponse(char command, bool checkEcho,
                                  const ResponseDemux::Bytes& raw) {
    EtherDreamResponse response;
    if (!response.decode(raw.data(), raw.size())) {
        logError("[EtherDreamSession] failed to decode reply to '", describeOpcode(command), "'\n");
        std::lock_guard lock(stateMutex);
        sessionState = sessionState.onInvalidated();
        return unexpected_code(SessionErrc::MalformedResponse);
    }

    {
        std::lock_guard lock(stateMutex);
        sessionState = sessionState.onResponse(command, response);
    }

    logInfo("[EtherDreamSession] RX '", static_cast<char>(response.response),
            "' for '", describeOpcode(command), "' | ", response.status.describe(), "\n");

    if (response.status.underflow()) {
        logWarning("[EtherDreamSession] laser buffer underrun; begin will be re-sent\n");
    }

    if (!response.isAck()) {
        logWarning("[EtherDreamSession] invalid response to '", describeOpcode(command), "': ",
                   EtherDreamResponse::describeResponseCode(response.response), "\n",
                   "           hex: ", EtherDreamStatus::toHexLine(raw.data(), raw.size()), "\n");
        return unexpected_code(SessionErrc::InvalidResponse);
    }

    const char echoed = static_cast<char>(response.command);
    if (checkEcho && echoed != command) {
        logError("[EtherDreamSession] reply echoes '", describeOpcode(echoed),
                 "' but '", describeOpcode(command), "' was sent\n");
        return unexpected_code(SessionErrc::UnexpectedCommand);
    }

    return DacAck{response.status, echoed};
}

void EtherDreamSession::handleTransportError(const std::error_code& ec) {
    if (ec == asio::error::eof) {
        logError("[EtherDreamSession] DAC closed the connection\n");
    } else {
        logError("[EtherDreamSession] RX error ", ec.value(), ' ', ec.category().name(),
                 " - ", ec.message(), "\n");
    }
    linkLost = true;
    {
        std::lock_guard lock(stateMutex);
        sessionState = sessionState.onInvalidated();
    }
    // Wake anyone blocked on a reply that can no longer arrive.
    demux.reset();
}

} // namespace etherstream::etherdream
