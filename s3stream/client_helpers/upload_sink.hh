/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <seastar/core/iostream.hh>
#include <seastar/net/packet.hh>
#include "multipart_upload.hh"

namespace s3stream {

// data_sink that uploads whatever is written into it. Data is accumulated
// until a part worth of it is collected, then sent as the next part of a
// multipart upload. Large buffers are split, no part is longer than the
// configured part size. flush() completes the upload; a small object which never
// filled a part is sent with a single PUT instead.
//
// Closing the sink before the upload was completed aborts it.
class upload_sink final : public multipart_upload, public seastar::data_sink_impl {
    segmented_buffer _bufs;
    const uint64_t _part_size;

    seastar::future<> maybe_flush();
    seastar::future<> append(seastar::temporary_buffer<char> buf);

public:
    upload_sink(seastar::shared_ptr<remote_upload_ops> ops, seastar::sstring bucket, seastar::sstring object_name, upload_options opts,
                seastar::abort_source* as = nullptr);

    virtual seastar::future<> put(seastar::net::packet) override;
    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override;
    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override;
    virtual seastar::future<> flush() override;
    virtual seastar::future<> close() override;

    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }
};

} // namespace s3stream
