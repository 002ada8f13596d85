/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include "put_object_content.hh"
#include "s3stream/log.hh"
#include "s3stream/upload_error.hh"
#include "s3stream/utils/names.hh"

using namespace seastar;

namespace s3stream {

put_object_content::put_object_content(shared_ptr<remote_upload_ops> ops,
                                       sstring bucket,
                                       sstring object_name,
                                       object_content content,
                                       upload_options opts,
                                       abort_source* as)
    : multipart_upload(std::move(ops), std::move(bucket), std::move(object_name), opts, as)
    , _content(std::move(content))
    , _part_size(opts.part_size) {
}

future<upload_outcome> put_object_content::upload() {
    auto stream = co_await std::move(_content).to_content_stream();
    std::exception_ptr ex;
    upload_outcome ret;
    try {
        ret = co_await do_upload(stream);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await stream.close();
    if (ex) {
        co_return coroutine::exception(std::move(ex));
    }
    co_return ret;
}

future<upload_outcome> put_object_content::do_upload(content_stream& stream) {
    utils::check_bucket_name(_bucket);
    utils::check_object_name(_object_name);

    auto object_size = stream.size();
    auto info = calc_part_info(object_size, _part_size);
    s3l.debug("Upload {}/{}: object size {}, part size {}, parts {}", _bucket, _object_name,
              object_size ? fmt::to_string(*object_size) : "unknown", info.part_size,
              info.part_count ? fmt::to_string(*info.part_count) : "unknown");
    account_total(object_size.value_or(0));

    if (_as) {
        _as->check();
    }
    auto first_part = co_await stream.read_upto(info.part_size);

    // Everything fits into one request, no need for create + PUT + wrap-up
    if ((!object_size && first_part.size() < info.part_size) || info.part_count == 1) {
        co_return co_await put_object(std::move(first_part));
    }
    if (object_size && first_part.size() < info.part_size) {
        throw make_insufficient_data(*object_size, first_part.size());
    }

    co_return co_await multi_part_upload(stream, info, std::move(first_part));
}

future<upload_outcome> put_object_content::put_object(segmented_buffer buf) {
    auto len = buf.size();
    s3l.trace("PUT {}/{} ({} bytes)", _bucket, _object_name, len);
    auto etag = co_await _ops->put_object(_bucket, _object_name, std::move(buf), _metadata);
    account_uploaded(len);
    co_return upload_outcome{
        .etag = std::move(etag),
        .size = len,
        .parts = 0,
    };
}

future<upload_outcome> put_object_content::multi_part_upload(content_stream& stream, part_info info, segmented_buffer first_part) {
    co_await start_upload();

    std::exception_ptr ex;
    try {
        co_await upload_parts(stream, info, std::move(first_part));
        auto res = co_await finalize_upload(stream.size());
        co_return upload_outcome{
            .etag = std::move(res.etag),
            .size = res.size,
            .parts = parts_count(),
        };
    } catch (...) {
        ex = std::current_exception();
    }
    s3l.debug("Upload {} of {}/{} failed: {}, aborting", _upload_id, _bucket, _object_name, ex);
    co_await abort_upload();
    co_return coroutine::exception(std::move(ex));
}

future<> put_object_content::upload_parts(content_stream& stream, part_info info, segmented_buffer first_part) {
    const auto object_size = stream.size();
    std::optional<segmented_buffer> first(std::move(first_part));
    unsigned part_number = 0;
    uint64_t bytes_read = 0;

    while (true) {
        if (_as) {
            _as->check();
        }
        segmented_buffer part;
        if (first) {
            part = std::move(*first);
            first.reset();
        } else {
            part = co_await stream.read_upto(info.part_size);
        }
        ++part_number;
        const auto len = part.size();

        if (len == 0 && part_number > 1) {
            // at least one part made it and the stream is over
            break;
        }
        if (!info.part_count && part_number > aws_maximum_parts_in_piece) {
            throw make_too_many_parts();
        }
        bytes_read += len;
        if (object_size && bytes_read > *object_size) {
            throw make_too_much_data(*object_size);
        }

        co_await upload_part(std::move(part));

        if (len < info.part_size) {
            break;
        }
    }
}

} // namespace s3stream
