/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include "segmented_buffer.hh"

namespace s3stream {

struct tag {
    std::string key;
    std::string value;
    auto operator<=>(const tag&) const = default;
};
using tag_set = std::vector<tag>;

enum class retention_mode : uint8_t {
    GOVERNANCE,
    COMPLIANCE,
};

// Object lock retention, the object cannot be overwritten or deleted
// before retain_until
struct object_retention {
    retention_mode mode;
    std::chrono::system_clock::time_point retain_until;
    bool operator==(const object_retention&) const = default;
};

// Server side encryption with keys kept by the store. Setting kms_key_id
// implies "aws:kms".
struct server_side_encryption {
    seastar::sstring algorithm = "AES256";
    std::optional<seastar::sstring> kms_key_id;
    bool operator==(const server_side_encryption&) const = default;
};

struct object_metadata {
    seastar::sstring content_type = "application/octet-stream";
    // sent as x-amz-meta-<key>
    std::map<seastar::sstring, seastar::sstring> user_metadata;
    // sent url-encoded as x-amz-tagging
    tag_set tags;
    std::optional<object_retention> retention;
    bool legal_hold = false;
    std::optional<server_side_encryption> sse;
};

struct part_descriptor {
    unsigned number;
    seastar::sstring etag;
    uint64_t size;
};

struct completed_upload {
    seastar::sstring etag;
    uint64_t size;
};

// The object store operations an upload is made of. Implementations deal
// with the transport, signing and retries; errors are reported by failing
// the returned future and are not interpreted by the caller.
//
// Arguments passed by reference must be kept alive by the caller until the
// returned future resolves.
class remote_upload_ops {
public:
    virtual ~remote_upload_ops() = default;

    // Returns the upload id of the new session
    virtual seastar::future<seastar::sstring> create_multipart_upload(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                                      const object_metadata& meta) = 0;

    // part_number is in [1, 10000]. Returns the part etag.
    virtual seastar::future<seastar::sstring> upload_part(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                          const seastar::sstring& upload_id, unsigned part_number, segmented_buffer body) = 0;

    // parts are ordered by their number
    virtual seastar::future<completed_upload> complete_multipart_upload(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                                        const seastar::sstring& upload_id,
                                                                        const std::vector<part_descriptor>& parts) = 0;

    virtual seastar::future<> abort_multipart_upload(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                     const seastar::sstring& upload_id) = 0;

    // Single request upload. Returns the object etag.
    virtual seastar::future<seastar::sstring> put_object(const seastar::sstring& bucket, const seastar::sstring& object_name, segmented_buffer body,
                                                         const object_metadata& meta) = 0;

    virtual seastar::future<> close() { return seastar::make_ready_future<>(); }
};

} // namespace s3stream
