/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include "part_info.hh"
#include "upload_error.hh"
#include "s3stream/utils/div_ceil.hh"

namespace s3stream {

part_info calc_part_info(content_size object_size, content_size part_size) {
    if (part_size) {
        if (*part_size < aws_minimum_part_size) {
            throw make_invalid_min_part_size(*part_size);
        }
        if (*part_size > aws_maximum_part_size) {
            throw make_invalid_max_part_size(*part_size);
        }
    }
    if (object_size && *object_size > aws_maximum_object_size) {
        throw make_invalid_object_size(*object_size);
    }

    if (!object_size) {
        if (!part_size) {
            throw make_missing_part_size();
        }
        return {*part_size, std::nullopt};
    }

    const uint64_t osize = *object_size;
    if (!part_size) {
        uint64_t psize = utils::div_ceil(osize, uint64_t(aws_maximum_parts_in_piece));
        psize = aws_minimum_part_size * utils::div_ceil(psize, aws_minimum_part_size);
        psize = std::min(psize, osize);
        // zero-sized object still makes one (empty) part
        unsigned count = psize > 0 ? utils::div_ceil(osize, psize) : 1;
        return {psize, count};
    }

    uint64_t count = utils::div_ceil(osize, *part_size);
    if (count == 0 || count > aws_maximum_parts_in_piece) {
        throw make_invalid_part_count(osize, *part_size, aws_maximum_parts_in_piece);
    }
    return {*part_size, unsigned(count)};
}

} // namespace s3stream
