/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <seastar/http/client.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>
#include "config.hh"
#include "remote_upload_ops.hh"

namespace s3stream {

// Unsigned path-style S3 requests over plain HTTP. Error replies are turned
// into remote_error, with the code and message from the XML error body.
class http_upload_ops : public remote_upload_ops {
    endpoint_config_ptr _cfg;
    seastar::http::experimental::client _http;

    seastar::future<> make_request(seastar::http::request req, seastar::http::experimental::client::reply_handler handle,
                                   seastar::http::reply::status_type expected);
    seastar::sstring object_path(const seastar::sstring& bucket, const seastar::sstring& object_name) const;

public:
    explicit http_upload_ops(endpoint_config_ptr cfg);

    virtual seastar::future<seastar::sstring> create_multipart_upload(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                                      const object_metadata& meta) override;
    virtual seastar::future<seastar::sstring> upload_part(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                          const seastar::sstring& upload_id, unsigned part_number, segmented_buffer body) override;
    virtual seastar::future<completed_upload> complete_multipart_upload(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                                        const seastar::sstring& upload_id,
                                                                        const std::vector<part_descriptor>& parts) override;
    virtual seastar::future<> abort_multipart_upload(const seastar::sstring& bucket, const seastar::sstring& object_name,
                                                     const seastar::sstring& upload_id) override;
    virtual seastar::future<seastar::sstring> put_object(const seastar::sstring& bucket, const seastar::sstring& object_name, segmented_buffer body,
                                                         const object_metadata& meta) override;
    virtual seastar::future<> close() override;
};

} // namespace s3stream
