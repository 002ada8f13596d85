/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <cstdint>
#include <optional>

namespace s3stream {

// Length of some content, std::nullopt if it cannot be known before the
// content is fully streamed.
using content_size = std::optional<uint64_t>;

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr uint64_t aws_minimum_part_size = uint64_t(5) << 20;
static constexpr uint64_t aws_maximum_part_size = uint64_t(5) << 30;
// "The largest object that can be uploaded in a single PUT is 5 GB", while
// multipart uploads go up to 5 TB.
static constexpr uint64_t aws_maximum_object_size = 1024 * aws_maximum_part_size;
// "Part numbers can be any number from 1 to 10,000, inclusive."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr unsigned aws_maximum_parts_in_piece = 10'000;

struct part_info {
    uint64_t part_size;
    // Empty iff the object size is unknown
    std::optional<unsigned> part_count;

    bool operator==(const part_info&) const = default;
};

// Returns the size of each part to upload and the number of parts, throws
// upload_exception if the sizes cannot make a valid upload.
//
// When the part size is not given it is picked as the smallest multiple of
// aws_minimum_part_size which keeps the number of parts within
// aws_maximum_parts_in_piece, but never larger than the object itself.
part_info calc_part_info(content_size object_size, content_size part_size);

} // namespace s3stream
