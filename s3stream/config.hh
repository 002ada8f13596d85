/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <optional>
#include <string>
#include <seastar/core/shared_ptr.hh>
#include "part_info.hh"
#include "remote_upload_ops.hh"

namespace s3stream {

struct endpoint_config {
    std::string host;
    unsigned port = 80;
    bool use_https = false;
    std::optional<unsigned> max_connections;

    // Parses "http://host[:port]", the URL must not have a path
    static endpoint_config from_url(std::string_view url);
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

struct upload_progress {
    uint64_t total = 0;
    uint64_t uploaded = 0;
};

struct upload_options {
    // Picked from the object size when not set, required when the size
    // is unknown
    content_size part_size;
    object_metadata metadata;
    upload_progress* progress = nullptr;
};

struct upload_outcome {
    seastar::sstring etag;
    uint64_t size = 0;
    // 0 for a simple put
    unsigned parts = 0;
};

} // namespace s3stream
