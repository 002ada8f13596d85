/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string_view>
#include <variant>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>
#include "part_info.hh"
#include "segmented_buffer.hh"

namespace s3stream {

// Serves reads of a requested size out of a source that produces chunks of
// arbitrary sizes. What a read does not consume is kept for the next one,
// without copying.
//
// Single owner, at most one read may be in flight. close() must be called
// before destruction, it releases the file or stream behind the source.
class content_stream {
public:
    struct buffer_source {
        segmented_buffer::container_type segments;
        size_t pos = 0;
    };
    // The file is opened on the first read and closed as soon as it is
    // exhausted.
    struct file_source {
        std::filesystem::path path;
        std::optional<seastar::input_stream<char>> in = {};
        bool exhausted = false;
    };
    struct stream_source {
        seastar::input_stream<char> in;
        bool closed = false;
    };
    using source_type = std::variant<buffer_source, file_source, stream_source>;

private:
    source_type _source;
    content_size _size;
    // Tail of the last chunk that did not fit into the previous read
    std::optional<seastar::temporary_buffer<char>> _extra;

    seastar::future<seastar::temporary_buffer<char>> next_chunk();
    seastar::future<> close_file(file_source& src);

public:
    content_stream(source_type source, content_size size);

    // The size the content was declared with, the actual amount of data may
    // differ.
    content_size size() const noexcept { return _size; }

    // Returns up to n bytes. Less than n is only returned once the source is
    // exhausted, so an empty result means end of content.
    seastar::future<segmented_buffer> read_upto(size_t n);

    seastar::future<> close();
};

// Content of an object to be uploaded: an in-memory buffer, a file, or a
// stream of unknown or declared length. Consumed once, by to_content_stream().
class object_content {
    struct file_path {
        std::filesystem::path path;
    };
    struct stream {
        seastar::input_stream<char> in;
        content_size size;
    };
    std::variant<segmented_buffer, file_path, stream> _content;

    template <typename T>
    explicit object_content(std::in_place_type_t<T> t, T content) : _content(t, std::move(content)) {}

public:
    object_content() = default;
    object_content(segmented_buffer buf);

    static object_content from_string(std::string_view str);
    static object_content from_buffer(seastar::temporary_buffer<char> buf);
    // The file size is taken when the content is turned into a stream,
    // not here.
    static object_content from_file(std::filesystem::path path);
    static object_content from_stream(seastar::input_stream<char> in, content_size size);

    seastar::future<content_stream> to_content_stream() &&;
};

} // namespace s3stream
