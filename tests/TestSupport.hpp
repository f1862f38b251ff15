#pragma once
// Shared helpers for the test executables: failure-counting asserts and a
// loopback fake EtherDream that speaks just enough of the protocol.

#include "etherstream/etherdream/EtherDreamCommand.hpp"
#include "etherstream/etherdream/EtherDreamResponse.hpp"
#include "etherstream/log/Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { etherstream::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { etherstream::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define REQUIRE_TRUE(cond, msg) \
    do { if (!(cond)) { etherstream::logError("REQUIRE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); std::exit(1); } } while(0)

inline int finishTests(const char* suite) {
    if (g_failures) {
        etherstream::logError(suite, " failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    etherstream::logInfo(suite, " passed.\n");
    return 0;
}

/// Poll @p pred until it holds or @p timeout elapses.
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return pred();
}

/// Build a 22-byte status reply.
inline std::array<std::uint8_t, 22>
makeReply(std::uint8_t responseCode, char command,
          etherstream::etherdream::PlaybackState playback,
          std::uint16_t bufferFullness = 0,
          std::uint16_t playbackFlags = 0,
          std::uint32_t pointRate = 0,
          std::uint32_t pointCount = 0,
          etherstream::etherdream::LightEngineState lightEngine =
              etherstream::etherdream::LightEngineState::Ready) {
    std::array<std::uint8_t, 22> raw{};
    raw[0] = responseCode;
    raw[1] = static_cast<std::uint8_t>(command);
    raw[2] = 0;                                   // protocol
    raw[3] = static_cast<std::uint8_t>(lightEngine);
    raw[4] = static_cast<std::uint8_t>(playback);
    raw[5] = 0;                                   // source
    raw[8] = static_cast<std::uint8_t>(playbackFlags & 0xFFu);
    raw[9] = static_cast<std::uint8_t>((playbackFlags >> 8) & 0xFFu);
    raw[12] = static_cast<std::uint8_t>(bufferFullness & 0xFFu);
    raw[13] = static_cast<std::uint8_t>((bufferFullness >> 8) & 0xFFu);
    for (int i = 0; i < 4; ++i) {
        raw[14 + i] = static_cast<std::uint8_t>((pointRate >> (8 * i)) & 0xFFu);
        raw[18 + i] = static_cast<std::uint8_t>((pointCount >> (8 * i)) & 0xFFu);
    }
    return raw;
}

/**
 * Loopback server that behaves like a (very forgiving) EtherDream.
 *
 * Serves one connection at a time. Every parsed command is recorded and
 * answered with a status reply reflecting a simulated playback state:
 * 'p' -> prepared, 'b'/'u' -> playing, 's'/'c'/0xFF -> idle.
 */
class FakeEtherDream {
public:
    FakeEtherDream() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE_TRUE(listenFd_ >= 0, "socket");

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0; // let the OS choose

        REQUIRE_TRUE(::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
        REQUIRE_TRUE(::listen(listenFd_, 4) == 0, "listen");

        socklen_t len = sizeof(addr);
        REQUIRE_TRUE(::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
        port_ = ntohs(addr.sin_port);

        running_.store(true);
        thread_ = std::thread([this]{ this->run(); });
    }

    ~FakeEtherDream() {
        stop();
    }

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return; // already stopped
        }
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        dropConnection();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    unsigned short port() const { return port_; }

    // --- scripting ----------------------------------------------------------

    void setSendGreeting(bool send) { sendGreeting_ = send; }
    void setByteByByte(bool enabled) { byteByByte_ = enabled; }
    void setBufferFullness(std::uint16_t fullness) { fullness_ = fullness; }

    /// The next reply to @p command carries @p code instead of an ACK.
    void nakNext(char command, std::uint8_t code) {
        std::lock_guard lock(mutex_);
        naks_[command] = code;
    }

    /// Never answer @p command.
    void ignore(char command) {
        std::lock_guard lock(mutex_);
        ignored_[command] = true;
    }

    /// The next data reply reports an underflow and falls back to prepared.
    void underflowOnNextData() { underflowPending_ = true; }

    /// Close the current client connection from the server side.
    void dropConnection() {
        const int fd = clientFd_.exchange(-1);
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
            ::close(fd);
        }
    }

    // --- observations -------------------------------------------------------

    std::vector<char> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    std::vector<std::uint16_t> dataCounts() const {
        std::lock_guard lock(mutex_);
        return dataCounts_;
    }

    std::vector<std::uint32_t> rates() const {
        std::lock_guard lock(mutex_);
        return rates_;
    }

    std::vector<etherstream::core::Sample> lastSamples() const {
        std::lock_guard lock(mutex_);
        return lastSamples_;
    }

    void clearRecording() {
        std::lock_guard lock(mutex_);
        commands_.clear();
        dataCounts_.clear();
        rates_.clear();
        bytesReceived_ = 0;
    }

    std::size_t bytesReceived() const {
        std::lock_guard lock(mutex_);
        return bytesReceived_;
    }

    int connectionsAccepted() const { return acceptedCount_.load(); }

    bool waitForCommands(std::size_t count,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) const {
        return waitUntil([&]{ return commands().size() >= count; }, timeout);
    }

private:
    using PlaybackState = etherstream::etherdream::PlaybackState;

    void run() {
        while (running_.load()) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                if (!running_.load()) {
                    break;
                }
                continue;
            }
            int opt = 1;
            ::setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
            acceptedCount_.fetch_add(1);
            clientFd_.store(client);
            serve(client);
            int expected = client;
            if (clientFd_.compare_exchange_strong(expected, -1)) {
                ::close(client);
            }
        }
    }

    void serve(int fd) {
        playback_ = PlaybackState::Idle;
        if (sendGreeting_.load()) {
            reply(fd, etherstream::etherdream::response_code::Ack, '?');
        }

        std::vector<std::uint8_t> inbound;
        std::array<std::uint8_t, 4096> chunk{};
        while (running_.load()) {
            const ssize_t n = ::recv(fd, chunk.data(), chunk.size(), 0);
            if (n <= 0) {
                return;
            }
            inbound.insert(inbound.end(), chunk.begin(), chunk.begin() + n);
            {
                std::lock_guard lock(mutex_);
                bytesReceived_ += static_cast<std::size_t>(n);
            }
            while (std::size_t used = parseOne(fd, inbound)) {
                inbound.erase(inbound.begin(), inbound.begin() + static_cast<std::ptrdiff_t>(used));
            }
        }
    }

    static std::uint16_t readU16(const std::vector<std::uint8_t>& in, std::size_t at) {
        return static_cast<std::uint16_t>(in[at] | (in[at + 1] << 8));
    }

    /// Handle one complete command at the front of @p in; returns bytes consumed.
    std::size_t parseOne(int fd, const std::vector<std::uint8_t>& in) {
        namespace op = etherstream::etherdream::opcode;
        using etherstream::etherdream::ETHERDREAM_SAMPLE_SIZE;

        if (in.empty()) {
            return 0;
        }
        const char command = static_cast<char>(in[0]);
        std::size_t length = 1;
        if (command == op::Begin || command == op::Update) {
            length = 7;
        } else if (command == op::Data) {
            if (in.size() < 3) {
                return 0;
            }
            length = 3 + ETHERDREAM_SAMPLE_SIZE * readU16(in, 1);
        }
        if (in.size() < length) {
            return 0;
        }

        bool underflow = false;
        std::uint8_t code = etherstream::etherdream::response_code::Ack;
        bool silent = false;
        {
            std::lock_guard lock(mutex_);
            commands_.push_back(command);
            if (command == op::Data) {
                const std::uint16_t count = readU16(in, 1);
                dataCounts_.push_back(count);
                lastSamples_.clear();
                for (std::size_t i = 0; i < count; ++i) {
                    const std::size_t at = 3 + i * ETHERDREAM_SAMPLE_SIZE;
                    etherstream::core::Sample s;
                    s.control = readU16(in, at);
                    s.x = static_cast<std::int16_t>(readU16(in, at + 2));
                    s.y = static_cast<std::int16_t>(readU16(in, at + 4));
                    s.r = readU16(in, at + 6);
                    s.g = readU16(in, at + 8);
                    s.b = readU16(in, at + 10);
                    s.i = readU16(in, at + 12);
                    s.u1 = readU16(in, at + 14);
                    s.u2 = readU16(in, at + 16);
                    lastSamples_.push_back(s);
                }
            } else if (command == op::Begin || command == op::Update) {
                rates_.push_back(static_cast<std::uint32_t>(in[3] | (in[4] << 8) | (in[5] << 16)
                                                            | (static_cast<std::uint32_t>(in[6]) << 24)));
            }
            if (auto it = naks_.find(command); it != naks_.end()) {
                code = it->second;
                naks_.erase(it);
            }
            silent = ignored_.count(command) != 0;
        }

        if (silent) {
            return length;
        }

        if (code == etherstream::etherdream::response_code::Ack) {
            switch (command) {
                case op::Prepare: playback_ = PlaybackState::Prepared; break;
                case op::Begin:
                case op::Update:  playback_ = PlaybackState::Playing; break;
                case op::Stop:
                case op::EmergencyStop:
                case op::ClearEmergencyStop: playback_ = PlaybackState::Idle; break;
                case op::Data:
                    if (underflowPending_.exchange(false)) {
                        underflow = true;
                        playback_ = PlaybackState::Prepared;
                    }
                    break;
                default: break;
            }
        }

        reply(fd, code, command, underflow);
        return length;
    }

    void reply(int fd, std::uint8_t code, char command, bool underflow = false) {
        using etherstream::etherdream::playback_flags::Underflow;
        const auto raw = makeReply(code, command, playback_, fullness_.load(),
                                   underflow ? Underflow : 0, 30000, 0);
        if (!byteByByte_.load()) {
            ::send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);
            return;
        }
        for (std::uint8_t byte : raw) {
            ::send(fd, &byte, 1, MSG_NOSIGNAL);
            std::this_thread::sleep_for(std::chrono::microseconds{200});
        }
    }

    int listenFd_ = -1;
    unsigned short port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<int> clientFd_{-1};
    std::atomic<int> acceptedCount_{0};
    std::thread thread_;

    std::atomic<bool> sendGreeting_{true};
    std::atomic<bool> byteByByte_{false};
    std::atomic<bool> underflowPending_{false};
    std::atomic<std::uint16_t> fullness_{0};
    PlaybackState playback_ = PlaybackState::Idle; // server thread only

    mutable std::mutex mutex_;
    std::map<char, std::uint8_t> naks_;
    std::map<char, bool> ignored_;
    std::vector<char> commands_;
    std::vector<std::uint16_t> dataCounts_;
    std::vector<std::uint32_t> rates_;
    std::vector<etherstream::core::Sample> lastSamples_;
    std::size_t bytesReceived_ = 0;
};
