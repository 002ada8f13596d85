/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "upload_error.hh"

namespace s3stream {

upload_exception::upload_exception(upload_error_type type, std::string message)
    : std::runtime_error(std::move(message))
    , _type(type) {
}

upload_exception make_invalid_min_part_size(uint64_t part_size) {
    return {upload_error_type::INVALID_PART_SIZE, fmt::format("part size {} is not supported; minimum allowed 5MiB", part_size)};
}

upload_exception make_invalid_max_part_size(uint64_t part_size) {
    return {upload_error_type::INVALID_PART_SIZE, fmt::format("part size {} is not supported; maximum allowed 5GiB", part_size)};
}

upload_exception make_invalid_object_size(uint64_t object_size) {
    return {upload_error_type::INVALID_OBJECT_SIZE, fmt::format("object size {} is not supported; maximum allowed 5TiB", object_size)};
}

upload_exception make_missing_part_size() {
    return {upload_error_type::MISSING_PART_SIZE, "valid part size must be provided when object size is unknown"};
}

upload_exception make_invalid_part_count(uint64_t object_size, uint64_t part_size, unsigned max_parts) {
    return {upload_error_type::INVALID_PART_COUNT,
            fmt::format("object size {} and part size {} make more than {} parts for upload", object_size, part_size, max_parts)};
}

upload_exception make_insufficient_data(uint64_t expected, uint64_t got) {
    return {upload_error_type::INSUFFICIENT_DATA, fmt::format("not enough data in the stream; expected: {}, got: {} bytes", expected, got)};
}

upload_exception make_too_much_data(uint64_t limit) {
    return {upload_error_type::TOO_MUCH_DATA, fmt::format("too much data in the stream - exceeds {} bytes", limit)};
}

upload_exception make_too_many_parts() {
    return {upload_error_type::TOO_MANY_PARTS, "too many parts for upload"};
}

upload_exception make_invalid_bucket_name(std::string_view bucket, std::string_view reason) {
    return {upload_error_type::INVALID_BUCKET_NAME, fmt::format("invalid bucket name '{}': {}", bucket, reason)};
}

upload_exception make_invalid_object_name(std::string_view reason) {
    return {upload_error_type::INVALID_OBJECT_NAME, fmt::format("invalid object name: {}", reason)};
}

remote_error::remote_error(int status, seastar::sstring code, const std::string& message)
    : std::runtime_error(message)
    , _status(status)
    , _code(std::move(code)) {
}

} // namespace s3stream

auto fmt::formatter<s3stream::upload_error_type>::format(s3stream::upload_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    using enum s3stream::upload_error_type;
    std::string_view name;
    switch (type) {
    case INVALID_PART_SIZE:   name = "InvalidPartSize"; break;
    case INVALID_OBJECT_SIZE: name = "InvalidObjectSize"; break;
    case INVALID_PART_COUNT:  name = "InvalidPartCount"; break;
    case MISSING_PART_SIZE:   name = "MissingPartSize"; break;
    case INSUFFICIENT_DATA:   name = "InsufficientData"; break;
    case TOO_MUCH_DATA:       name = "TooMuchData"; break;
    case TOO_MANY_PARTS:      name = "TooManyParts"; break;
    case INVALID_UPLOAD_ID:   name = "InvalidUploadId"; break;
    case INVALID_RESPONSE:    name = "InvalidResponse"; break;
    case INVALID_BUCKET_NAME: name = "InvalidBucketName"; break;
    case INVALID_OBJECT_NAME: name = "InvalidObjectName"; break;
    }
    return fmt::formatter<fmt::string_view>::format(name, ctx);
}
