/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include "segmented_buffer.hh"

namespace s3stream {

segmented_buffer::segmented_buffer(buffer_type buf) {
    append(std::move(buf));
}

segmented_buffer::segmented_buffer(std::string_view str)
    : segmented_buffer(buffer_type(str.data(), str.size())) {
}

void segmented_buffer::append(buffer_type buf) {
    if (buf.empty()) {
        return;
    }
    _size += buf.size();
    _segments.emplace_back(std::move(buf));
}

void segmented_buffer::append(segmented_buffer other) {
    _segments.reserve(_segments.size() + other._segments.size());
    for (auto& buf : other._segments) {
        append(std::move(buf));
    }
}

segmented_buffer segmented_buffer::share() {
    segmented_buffer ret;
    ret._segments.reserve(_segments.size());
    for (auto& buf : _segments) {
        ret._segments.emplace_back(buf.share());
    }
    ret._size = _size;
    return ret;
}

segmented_buffer::container_type segmented_buffer::release() && {
    _size = 0;
    return std::move(_segments);
}

segmented_buffer::buffer_type segmented_buffer::linearize() const {
    buffer_type ret(_size);
    auto out = ret.get_write();
    for (const auto& buf : _segments) {
        out = std::copy_n(buf.get(), buf.size(), out);
    }
    return ret;
}

bool segmented_buffer::operator==(const segmented_buffer& other) const {
    if (_size != other._size) {
        return false;
    }
    auto a = linearize();
    auto b = other.linearize();
    return std::equal(a.get(), a.get() + a.size(), b.get());
}

} // namespace s3stream
