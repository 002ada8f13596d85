/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

/*
 * Copyright (C) 2026-present ScyllaDB
 */

#include "http.hh"
#include "s3stream/config.hh"

#include <strings.h>
#include <boost/regex.hpp>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>
#include <seastar/net/api.hh>
#include <seastar/net/dns.hh>

using namespace seastar;

namespace s3stream::utils::http {

dns_connection_factory::dns_connection_factory(std::string host, int port, logger& logger)
    : _host(std::move(host))
    , _port(port)
    , _logger(logger)
{}

future<net::inet_address> dns_connection_factory::get_address() {
    if (_addr_list.empty()) [[unlikely]] {
        auto units = co_await get_units(_init_semaphore, 1);
        if (_addr_list.empty()) {
            auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
            for (auto& e : hent.addr_entries) {
                _addr_list.push_back(e.addr);
            }
            if (_addr_list.empty()) {
                throw std::runtime_error(fmt::format("Host {} resolved to no addresses", _host));
            }
            _logger.debug("Initialized addresses={}", _addr_list);
        }
    }

    co_return _addr_list[_addr_pos++ % _addr_list.size()];
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    auto socket_addr = socket_address(co_await get_address(), _port);
    _logger.debug("Making new HTTP connection addr={} host={}", socket_addr, _host);
    co_return co_await seastar::connect(socket_addr, {}, transport::TCP);
}

static const char HTTPS[] = "https";

url_info parse_simple_url(std::string_view uri) {
    // A numeric ipv6 address followed by a port is wrapped in "[]",
    // like http://[2001:db8:4006:812::200e]:8080
    static boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:]+)(:\d+)?(\/.*)?)foo");

    boost::smatch m;
    std::string tmp(uri);

    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    auto host = m[2].str();
    auto port = m[3].str();
    auto path = m[4].str();

    bool https = (strcasecmp(scheme.c_str(), HTTPS) == 0);

    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = std::move(path),
        .port = uint16_t(port.empty() ? (https ? 443 : 80) : std::stoi(port.substr(1)))
    };
}

bool url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}

} // namespace s3stream::utils::http

namespace s3stream {

endpoint_config endpoint_config::from_url(std::string_view url) {
    auto info = utils::http::parse_simple_url(url);
    if (!info.path.empty() && info.path != "/") {
        throw std::invalid_argument(fmt::format("Cannot handle path in URI: {}", url));
    }
    if (info.is_https()) {
        throw std::invalid_argument(fmt::format("HTTPS endpoints are not supported: {}", url));
    }
    return endpoint_config{
        .host = std::move(info.host),
        .port = info.port,
        .use_https = false,
    };
}

} // namespace s3stream
