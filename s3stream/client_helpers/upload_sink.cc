/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/util/backtrace.hh>
#include "upload_sink.hh"
#include "s3stream/log.hh"
#include "s3stream/upload_error.hh"
#include "s3stream/utils/names.hh"

using namespace seastar;

namespace s3stream {

upload_sink::upload_sink(shared_ptr<remote_upload_ops> ops, sstring bucket, sstring object_name, upload_options opts, abort_source* as)
    : multipart_upload(std::move(ops), std::move(bucket), std::move(object_name), opts, as)
    , _part_size(calc_part_info(std::nullopt, opts.part_size.value_or(aws_minimum_part_size)).part_size) {
    utils::check_bucket_name(_bucket);
    utils::check_object_name(_object_name);
}

future<> upload_sink::maybe_flush() {
    if (_bufs.size() < _part_size) {
        co_return;
    }
    if (_as) {
        _as->check();
    }
    if (parts_count() >= aws_maximum_parts_in_piece) {
        throw make_too_many_parts();
    }
    if (!upload_started()) {
        co_await start_upload();
    }
    co_await upload_part(std::exchange(_bufs, {}));
}

// Buffers are cut at the part boundary, so every part but the last one is
// exactly _part_size long
future<> upload_sink::append(temporary_buffer<char> buf) {
    account_total(buf.size());
    while (!buf.empty()) {
        auto n = std::min<uint64_t>(buf.size(), _part_size - _bufs.size());
        _bufs.append(buf.share(0, n));
        buf.trim_front(n);
        co_await maybe_flush();
    }
}

future<> upload_sink::put(net::packet) {
    throw_with_backtrace<std::runtime_error>("s3stream put(net::packet) unsupported");
}

future<> upload_sink::put(temporary_buffer<char> buf) {
    return append(std::move(buf));
}

future<> upload_sink::put(std::vector<temporary_buffer<char>> data) {
    for (auto&& buf : data) {
        co_await append(std::move(buf));
    }
}

future<> upload_sink::flush() {
    if (!_bufs.empty()) {
        // This is handy for small objects that are uploaded via the sink. It makes
        // upload happen in one REST call, instead of three (create + PUT + wrap-up)
        if (!upload_started()) {
            s3l.trace("Sink fallback to plain PUT for {}/{}", _bucket, _object_name);
            auto len = _bufs.size();
            co_await _ops->put_object(_bucket, _object_name, std::exchange(_bufs, {}), _metadata);
            account_uploaded(len);
            co_return;
        }

        co_await upload_part(std::exchange(_bufs, {}));
    }
    if (upload_started()) {
        std::exception_ptr ex;
        try {
            co_await finalize_upload(std::nullopt);
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            co_await abort_upload();
            std::rethrow_exception(ex);
        }
    }
}

future<> upload_sink::close() {
    if (upload_started()) {
        s3l.warn("closing incomplete multipart upload -> aborting");
        co_await abort_upload();
    } else {
        s3l.trace("closing multipart upload");
    }
}

} // namespace s3stream
