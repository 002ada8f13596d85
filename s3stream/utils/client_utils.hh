/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>
#include <rapidxml.hpp>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>
#include "s3stream/remote_upload_ops.hh"
#include "s3stream/upload_error.hh"

namespace s3stream {

seastar::sstring parse_multipart_upload_id(seastar::sstring& body);
// Throws remote_error if the body is an <Error> reply, which S3 may send
// with a 200 status once the reply headers are already out.
seastar::sstring parse_multipart_complete_etag(int status, seastar::sstring& body);
std::optional<remote_error> parse_error_response(int status, seastar::sstring& body);
unsigned prepare_multipart_upload_parts(const std::vector<part_descriptor>& parts);
seastar::future<> dump_multipart_upload_parts(seastar::output_stream<char> out, const std::vector<part_descriptor>& parts);
rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names);

} // namespace s3stream
