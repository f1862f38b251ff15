#include "etherstream/net/TcpClient.hpp"
#include "etherstream/log/Log.hpp"

#include <utility>

namespace etherstream::net {

TcpClient::TcpClient()
: io_(shared_io_context())
, strand_(asio::make_strand(*io_))
, socket_(strand_)
, defaultTimeout_(TimeoutConfig::defaultTimeout())
, connectTimeout_(TimeoutConfig::defaultTimeout())
{}

TcpClient::~TcpClient() {
    close();
}

error_code TcpClient::connect(const tcp::endpoint& endpoint, duration timeout) {
    close();
    runOnStrand([this]{ socket_ = tcp::socket(strand_); });
    auto ec = connect_one(endpoint, timeout);
    if (!ec) {
        open_ = true;
    }
    return ec;
}

error_code TcpClient::connect(const std::vector<tcp::endpoint>& endpoints, duration timeout) {
    error_code last = asio::error::host_not_found;

    for (const auto& endpoint : endpoints) {
        auto ec = connect(endpoint, timeout);
        if (!ec) return ec;   // success
        last = ec;            // remember last error and try next
    }
    return last;
}

error_code TcpClient::connect_one(const tcp::endpoint& ep, duration timeout) {
    return with_deadline(strand_, TimeoutConfig::sanitize(timeout),
        [this, ep](auto completion){
            asio::dispatch(strand_, [this, ep, completion]{
                socket_.async_connect(ep, completion);
            });
        },
        [this]{
            asio::dispatch(strand_, [this]{
                error_code ignored;
                socket_.cancel(ignored);
            });
        }
    );
}

error_code TcpClient::write_all(const void* buf, std::size_t n, duration timeout) {
    if (!is_open()) {
        return asio::error::not_connected;
    }
    return with_deadline(strand_, TimeoutConfig::sanitize(timeout),
        [this, buf, n](auto completion){
            asio::dispatch(strand_, [this, buf, n, completion]{
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            });
        },
        [this]{
            asio::dispatch(strand_, [this]{
                error_code ignored;
                socket_.cancel(ignored);
            });
        }
    );
}

void TcpClient::startReceiving(ReceiveHandler onData, ReceiveErrorHandler onError) {
    stopReceiving();

    auto receiver = std::make_shared<Receiver>();
    receiver->onData = std::move(onData);
    receiver->onError = std::move(onError);
    {
        std::lock_guard lock(receiverMutex_);
        receiver_ = receiver;
    }
    asio::dispatch(strand_, [this, receiver]{ receiveNext(receiver); });
}

void TcpClient::receiveNext(std::shared_ptr<Receiver> receiver) {
    if (!receiver->active) {
        return;
    }
    socket_.async_read_some(asio::buffer(receiver->buffer),
        [this, receiver](const error_code& ec, std::size_t bytes) {
            // Checked before touching `this`: a stopped receiver may outlive the client.
            if (!receiver->active) {
                return;
            }
            if (ec) {
                receiver->active = false;
                if (receiver->onError) {
                    receiver->onError(ec);
                }
                return;
            }
            if (receiver->onData) {
                receiver->onData(receiver->buffer.data(), bytes);
            }
            receiveNext(receiver);
        });
}

void TcpClient::stopReceiving() {
    std::shared_ptr<Receiver> receiver;
    {
        std::lock_guard lock(receiverMutex_);
        receiver = std::move(receiver_);
    }
    if (!receiver) {
        return;
    }
    // Deactivating on the strand guarantees no handler is mid-callback afterwards.
    runOnStrand([this, &receiver]{
        receiver->active = false;
        error_code ignored;
        socket_.cancel(ignored);
    });
}

void TcpClient::setLowLatency() {
    runOnStrand([this]{
        error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
    });
}

void TcpClient::close() {
    stopReceiving();
    if (open_.exchange(false)) {
        logInfo("[TcpClient] close()\n");
    }
    // A failed or timed-out connect can leave the socket open without open_ set.
    runOnStrand([this]{
        if (!socket_.is_open()) return;
        error_code ec;
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    });
}

} // namespace etherstream::net
