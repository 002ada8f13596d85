/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

/*
 * Copyright (C) 2026-present ScyllaDB
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <seastar/core/semaphore.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/util/log.hh>

namespace s3stream::utils::http {

// Plain TCP connections to a host that is resolved once, on first use.
// Resolved addresses are handed out round-robin.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    int _port;
    seastar::logger& _logger;
    seastar::semaphore _init_semaphore{1};
    std::vector<seastar::net::inet_address> _addr_list;
    size_t _addr_pos = 0;

    seastar::future<seastar::net::inet_address> get_address();

public:
    dns_connection_factory(std::string host, int port, seastar::logger& logger);

    virtual seastar::future<seastar::connected_socket> make(seastar::abort_source*) override;
};

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
};

url_info parse_simple_url(std::string_view uri);

} // namespace s3stream::utils::http
