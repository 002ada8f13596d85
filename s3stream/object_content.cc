/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include "object_content.hh"
#include "log.hh"

using namespace seastar;

namespace s3stream {

static file_input_stream_options input_stream_options() {
    // Files are consumed sequentially, part by part, and the chunks end up
    // in a part body as they are, without being copied. 64K chunks keep the
    // number of segments in a part low.
    file_input_stream_options options;
    options.buffer_size = 64 << 10;
    options.read_ahead = 1;
    return options;
}

content_stream::content_stream(source_type source, content_size size)
    : _source(std::move(source))
    , _size(size) {
}

future<temporary_buffer<char>> content_stream::next_chunk() {
    if (auto* src = std::get_if<buffer_source>(&_source)) {
        if (src->pos == src->segments.size()) {
            co_return temporary_buffer<char>();
        }
        co_return std::move(src->segments[src->pos++]);
    }

    if (auto* src = std::get_if<file_source>(&_source)) {
        if (src->exhausted) {
            co_return temporary_buffer<char>();
        }
        if (!src->in) {
            s3l.trace("Open {} for reading", src->path.native());
            auto f = co_await open_file_dma(src->path.native(), open_flags::ro);
            src->in.emplace(make_file_input_stream(std::move(f), input_stream_options()));
        }
        auto buf = co_await src->in->read();
        if (buf.empty()) {
            co_await close_file(*src);
        }
        co_return buf;
    }

    auto& src = std::get<stream_source>(_source);
    if (src.closed) {
        co_return temporary_buffer<char>();
    }
    co_return co_await src.in.read();
}

future<> content_stream::close_file(file_source& src) {
    src.exhausted = true;
    if (src.in) {
        auto in = std::move(*src.in);
        src.in.reset();
        s3l.trace("Close {}", src.path.native());
        co_await in.close();
    }
}

future<segmented_buffer> content_stream::read_upto(size_t n) {
    segmented_buffer ret;
    size_t remaining = n;

    if (_extra) {
        auto extra = std::move(*_extra);
        _extra.reset();
        if (extra.size() <= remaining) {
            remaining -= extra.size();
            ret.append(std::move(extra));
        } else {
            ret.append(extra.share(0, remaining));
            extra.trim_front(remaining);
            _extra = std::move(extra);
            co_return ret;
        }
    }

    while (remaining > 0) {
        auto buf = co_await next_chunk();
        if (buf.empty()) {
            break;
        }
        if (buf.size() <= remaining) {
            remaining -= buf.size();
            ret.append(std::move(buf));
        } else {
            ret.append(buf.share(0, remaining));
            buf.trim_front(remaining);
            _extra = std::move(buf);
            break;
        }
    }
    co_return ret;
}

future<> content_stream::close() {
    _extra.reset();
    if (auto* src = std::get_if<file_source>(&_source)) {
        co_await close_file(*src);
    } else if (auto* src = std::get_if<stream_source>(&_source)) {
        if (!src->closed) {
            src->closed = true;
            co_await src->in.close();
        }
    } else {
        std::get<buffer_source>(_source).segments.clear();
    }
}

object_content::object_content(segmented_buffer buf)
    : _content(std::move(buf)) {
}

object_content object_content::from_string(std::string_view str) {
    return object_content(segmented_buffer(str));
}

object_content object_content::from_buffer(temporary_buffer<char> buf) {
    return object_content(segmented_buffer(std::move(buf)));
}

object_content object_content::from_file(std::filesystem::path path) {
    return object_content(std::in_place_type<file_path>, file_path{std::move(path)});
}

object_content object_content::from_stream(input_stream<char> in, content_size size) {
    return object_content(std::in_place_type<stream>, stream{std::move(in), size});
}

future<content_stream> object_content::to_content_stream() && {
    if (auto* buf = std::get_if<segmented_buffer>(&_content)) {
        content_size size = buf->size();
        co_return content_stream(content_stream::buffer_source{std::move(*buf).release()}, size);
    }
    if (auto* fp = std::get_if<file_path>(&_content)) {
        content_size size = co_await file_size(fp->path.native());
        s3l.trace("Uploading {} of {} bytes", fp->path.native(), *size);
        co_return content_stream(content_stream::file_source{std::move(fp->path)}, size);
    }
    auto& s = std::get<stream>(_content);
    co_return content_stream(content_stream::stream_source{std::move(s.in)}, s.size);
}

} // namespace s3stream
