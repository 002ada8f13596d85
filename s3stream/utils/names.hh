/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <string_view>

namespace s3stream::utils {

// Throws upload_exception(INVALID_BUCKET_NAME) unless the name follows the
// S3 bucket naming rules: 3 to 63 lowercase letters, digits, dots and
// hyphens, starting and ending with a letter or digit, not shaped like an
// IPv4 address.
void check_bucket_name(std::string_view bucket);

// Throws upload_exception(INVALID_OBJECT_NAME) for an empty name
void check_object_name(std::string_view object_name);

} // namespace s3stream::utils
