/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <boost/regex.hpp>
#include "names.hh"
#include "s3stream/upload_error.hh"

namespace s3stream::utils {

void check_bucket_name(std::string_view bucket) {
    static const boost::regex ipv4_address(R"foo(((25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])\.){3}(25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9]))foo");
    static const boost::regex valid_bucket_name(R"foo([a-z0-9][a-z0-9\.\-]{1,61}[a-z0-9])foo");

    if (bucket.empty()) {
        throw make_invalid_bucket_name(bucket, "bucket name cannot be empty");
    }
    if (bucket.size() < 3) {
        throw make_invalid_bucket_name(bucket, "bucket name cannot be less than 3 characters");
    }
    if (bucket.size() > 63) {
        throw make_invalid_bucket_name(bucket, "bucket name cannot be greater than 63 characters");
    }
    if (boost::regex_match(bucket.begin(), bucket.end(), ipv4_address)) {
        throw make_invalid_bucket_name(bucket, "bucket name cannot be an IP address");
    }
    if (bucket.find("..") != std::string_view::npos || bucket.find(".-") != std::string_view::npos || bucket.find("-.") != std::string_view::npos) {
        throw make_invalid_bucket_name(bucket, "bucket name contains invalid successive characters '..', '.-' or '-.'");
    }
    if (!boost::regex_match(bucket.begin(), bucket.end(), valid_bucket_name)) {
        throw make_invalid_bucket_name(bucket, "bucket name does not follow S3 standards strictly");
    }
}

void check_object_name(std::string_view object_name) {
    if (object_name.empty()) {
        throw make_invalid_object_name("object name cannot be empty");
    }
}

} // namespace s3stream::utils
