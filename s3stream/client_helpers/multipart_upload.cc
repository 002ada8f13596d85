/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/on_internal_error.hh>
#include "multipart_upload.hh"
#include "s3stream/log.hh"
#include "s3stream/upload_error.hh"

using namespace seastar;

namespace s3stream {

bool multipart_upload::upload_started() const noexcept {
    return !_upload_id.empty();
}

multipart_upload::multipart_upload(shared_ptr<remote_upload_ops> ops, sstring bucket, sstring object_name, upload_options opts, abort_source* as)
    : _ops(std::move(ops))
    , _bucket(std::move(bucket))
    , _object_name(std::move(object_name))
    , _metadata(std::move(opts.metadata))
    , _progress(opts.progress)
    , _as(as) {
}

future<> multipart_upload::start_upload() {
    if (upload_started() || !_parts.empty()) {
        on_internal_error(s3l, format("multipart upload of {}/{} started twice", _bucket, _object_name));
    }
    s3l.trace("POST uploads {}/{}", _bucket, _object_name);
    auto upload_id = co_await _ops->create_multipart_upload(_bucket, _object_name, _metadata);
    if (upload_id.empty()) {
        throw upload_exception(upload_error_type::INVALID_UPLOAD_ID, format("cannot initiate upload of {}/{}: empty upload id", _bucket, _object_name));
    }
    _upload_id = std::move(upload_id);
    s3l.trace("created uploads for {}/{} -> id = {}", _bucket, _object_name, _upload_id);
}

future<> multipart_upload::upload_part(segmented_buffer bufs) {
    unsigned part_number = _parts.size() + 1;
    auto size = bufs.size();
    s3l.trace("PUT part {} {} bytes in {} buffers (upload id {})", part_number, size, bufs.segments_count(), _upload_id);
    auto etag = co_await _ops->upload_part(_bucket, _object_name, _upload_id, part_number, std::move(bufs));
    s3l.trace("uploaded {} part data -> etag = {} (upload id {})", part_number, etag, _upload_id);
    _parts.push_back(part_descriptor{
        .number = part_number,
        .etag = std::move(etag),
        .size = size,
    });
    _bytes_uploaded += size;
    account_uploaded(size);
}

future<completed_upload> multipart_upload::finalize_upload(content_size expected_size) {
    if (expected_size && *expected_size != _bytes_uploaded) {
        throw make_insufficient_data(*expected_size, _bytes_uploaded);
    }
    s3l.trace("wrap up upload {} of {} parts", _upload_id, _parts.size());
    auto ret = co_await _ops->complete_multipart_upload(_bucket, _object_name, _upload_id, _parts);
    _upload_id = {}; // now upload_started() returns false
    co_return ret;
}

future<> multipart_upload::abort_upload() noexcept {
    if (!upload_started()) {
        co_return;
    }
    auto upload_id = std::exchange(_upload_id, {});
    s3l.trace("DELETE upload {}", upload_id);
    try {
        co_await _ops->abort_multipart_upload(_bucket, _object_name, upload_id);
    } catch (...) {
        // The backend reclaims stale uploads eventually
        s3l.warn("Failed to abort upload {} of {}/{}: {}", upload_id, _bucket, _object_name, std::current_exception());
    }
}

void multipart_upload::account_total(uint64_t size) noexcept {
    if (_progress) {
        _progress->total += size;
    }
}

void multipart_upload::account_uploaded(uint64_t size) noexcept {
    if (_progress) {
        _progress->uploaded += size;
    }
}

} // namespace s3stream
