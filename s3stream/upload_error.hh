/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <seastar/core/sstring.hh>

namespace s3stream {

enum class upload_error_type : uint8_t {
    INVALID_PART_SIZE,
    INVALID_OBJECT_SIZE,
    INVALID_PART_COUNT,
    MISSING_PART_SIZE,
    INSUFFICIENT_DATA,
    TOO_MUCH_DATA,
    TOO_MANY_PARTS,
    INVALID_UPLOAD_ID,
    INVALID_RESPONSE,
    INVALID_BUCKET_NAME,
    INVALID_OBJECT_NAME,
};

// Local validation and logic errors. These are detected before or while the
// content is streamed and are never retried.
class upload_exception : public std::runtime_error {
    upload_error_type _type;

public:
    upload_exception(upload_error_type type, std::string message);

    upload_error_type type() const noexcept { return _type; }
};

upload_exception make_invalid_min_part_size(uint64_t part_size);
upload_exception make_invalid_max_part_size(uint64_t part_size);
upload_exception make_invalid_object_size(uint64_t object_size);
upload_exception make_missing_part_size();
upload_exception make_invalid_part_count(uint64_t object_size, uint64_t part_size, unsigned max_parts);
upload_exception make_insufficient_data(uint64_t expected, uint64_t got);
upload_exception make_too_much_data(uint64_t limit);
upload_exception make_too_many_parts();
upload_exception make_invalid_bucket_name(std::string_view bucket, std::string_view reason);
upload_exception make_invalid_object_name(std::string_view reason);

// An error reply from the object store.
class remote_error : public std::runtime_error {
    int _status;
    seastar::sstring _code;

public:
    remote_error(int status, seastar::sstring code, const std::string& message);

    // HTTP status of the failed reply
    int status() const noexcept { return _status; }
    // S3 error code (e.g. "NoSuchUpload"), empty when the reply had no error body
    const seastar::sstring& code() const noexcept { return _code; }
};

} // namespace s3stream

template <>
struct fmt::formatter<s3stream::upload_error_type> : fmt::formatter<fmt::string_view> {
    auto format(s3stream::upload_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out());
};
