#pragma once
#include "etherstream/net/NetConfig.hpp"
#include <string>
#include <vector>

namespace etherstream::net {

/**
 * resolve
 *
 * Synchronous lookup of `host` (a dotted quad or a DNS name) for a numeric
 * TCP port. Literal addresses short-circuit the resolver so they work without
 * name service. Fills @p out with candidate endpoints in resolver order.
 */
inline error_code resolve(asio::io_context& io,
                          const std::string& host,
                          unsigned short port,
                          std::vector<tcp::endpoint>& out)
{
    out.clear();

    error_code ec;
    const auto literal = asio::ip::make_address(host, ec);
    if (!ec) {
        out.emplace_back(literal, port);
        return {};
    }

    tcp::resolver r(io);
    const auto results = r.resolve(host, std::to_string(port),
                                   tcp::resolver::numeric_service, ec);
    if (ec) {
        return ec;
    }
    for (const auto& entry : results) {
        out.push_back(entry.endpoint());
    }
    if (out.empty()) {
        return asio::error::host_not_found;
    }
    return {};
}

} // namespace etherstream::net
