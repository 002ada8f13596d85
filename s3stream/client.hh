/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <filesystem>
#include <seastar/core/abort_source.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>
#include "config.hh"
#include "object_content.hh"
#include "remote_upload_ops.hh"

namespace s3stream {

class client : public seastar::enable_shared_from_this<client> {
    seastar::shared_ptr<remote_upload_ops> _ops;
    struct private_tag {};

public:
    client(seastar::shared_ptr<remote_upload_ops> ops, private_tag);
    static seastar::shared_ptr<client> make(seastar::shared_ptr<remote_upload_ops> ops);
    static seastar::shared_ptr<client> make(endpoint_config_ptr cfg);

    seastar::future<upload_outcome> upload(seastar::sstring bucket,
                                           seastar::sstring object_name,
                                           object_content content,
                                           upload_options opts = {},
                                           seastar::abort_source* as = nullptr);
    seastar::future<upload_outcome> upload_file(std::filesystem::path path,
                                                seastar::sstring bucket,
                                                seastar::sstring object_name,
                                                upload_options opts = {},
                                                seastar::abort_source* as = nullptr);

    // The sink completes the upload on flush(), see upload_sink
    seastar::data_sink make_upload_sink(seastar::sstring bucket,
                                        seastar::sstring object_name,
                                        upload_options opts = {},
                                        seastar::abort_source* as = nullptr);

    seastar::future<> close();
};

} // namespace s3stream
