/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/shared_ptr.hh>
#include "s3stream/config.hh"
#include "s3stream/remote_upload_ops.hh"

namespace s3stream {

// State of one multipart upload session on the remote side. The session
// exists between start_upload() and either finalize_upload() or
// abort_upload(); each of them is issued at most once.
class multipart_upload {
protected:
    seastar::shared_ptr<remote_upload_ops> _ops;
    seastar::sstring _bucket;
    seastar::sstring _object_name;
    object_metadata _metadata;
    upload_progress* _progress;
    seastar::abort_source* _as;
    seastar::sstring _upload_id;
    std::vector<part_descriptor> _parts;
    uint64_t _bytes_uploaded = 0;

    seastar::future<> start_upload();
    seastar::future<> upload_part(segmented_buffer bufs);
    // Checks the uploaded parts add up to the expected size, if known
    seastar::future<completed_upload> finalize_upload(content_size expected_size);
    // Best effort, failures are logged and swallowed
    seastar::future<> abort_upload() noexcept;

    bool upload_started() const noexcept;
    unsigned parts_count() const noexcept { return _parts.size(); }

    void account_total(uint64_t size) noexcept;
    void account_uploaded(uint64_t size) noexcept;

public:
    multipart_upload(seastar::shared_ptr<remote_upload_ops> ops, seastar::sstring bucket, seastar::sstring object_name, upload_options opts,
                     seastar::abort_source* as);
};

} // namespace s3stream
