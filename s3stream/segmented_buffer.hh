/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <string_view>
#include <vector>
#include <seastar/core/temporary_buffer.hh>

namespace s3stream {

// An append-only sequence of immutable buffers.
//
// Appending never copies the data, the buffers are just linked in. The
// buffers themselves are reference counted, so shares of the same memory
// may live in several segmented_buffer-s at once and the memory is released
// when the last of them goes away. Like any temporary_buffer, the segments
// belong to the shard that created them.
class segmented_buffer {
public:
    using buffer_type = seastar::temporary_buffer<char>;
    using container_type = std::vector<buffer_type>;
    using const_iterator = container_type::const_iterator;

private:
    container_type _segments;
    size_t _size = 0;

public:
    segmented_buffer() = default;
    explicit segmented_buffer(buffer_type buf);
    // Copies the string into a single segment
    explicit segmented_buffer(std::string_view str);

    segmented_buffer(segmented_buffer&&) noexcept = default;
    segmented_buffer& operator=(segmented_buffer&&) noexcept = default;

    // Empty buffers are dropped.
    void append(buffer_type buf);
    void append(segmented_buffer other);

    size_t size() const noexcept { return _size; }
    bool empty() const noexcept { return _size == 0; }
    size_t segments_count() const noexcept { return _segments.size(); }

    const_iterator begin() const noexcept { return _segments.begin(); }
    const_iterator end() const noexcept { return _segments.end(); }

    // Another segmented_buffer referencing the same memory
    segmented_buffer share();

    container_type release() &&;

    // Copies everything into one contiguous buffer. Slow, meant for tests and
    // debugging only.
    buffer_type linearize() const;

    // Compares the content, regardless of how it is split into segments.
    bool operator==(const segmented_buffer& other) const;
};

} // namespace s3stream
