/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include "client.hh"
#include "client_helpers/put_object_content.hh"
#include "client_helpers/upload_sink.hh"
#include "http_upload_ops.hh"
#include "log.hh"

using namespace seastar;

namespace s3stream {

client::client(shared_ptr<remote_upload_ops> ops, private_tag)
        : _ops(std::move(ops)) {
}

shared_ptr<client> client::make(shared_ptr<remote_upload_ops> ops) {
    return seastar::make_shared<client>(std::move(ops), private_tag{});
}

shared_ptr<client> client::make(endpoint_config_ptr cfg) {
    s3l.debug("Making client for {}:{}", cfg->host, cfg->port);
    return make(seastar::make_shared<http_upload_ops>(std::move(cfg)));
}

future<upload_outcome> client::upload(sstring bucket, sstring object_name, object_content content, upload_options opts, abort_source* as) {
    put_object_content put{_ops, std::move(bucket), std::move(object_name), std::move(content), std::move(opts), as};
    co_return co_await put.upload();
}

future<upload_outcome> client::upload_file(std::filesystem::path path, sstring bucket, sstring object_name, upload_options opts, abort_source* as) {
    return upload(std::move(bucket), std::move(object_name), object_content::from_file(std::move(path)), std::move(opts), as);
}

data_sink client::make_upload_sink(sstring bucket, sstring object_name, upload_options opts, abort_source* as) {
    return data_sink(std::make_unique<upload_sink>(_ops, std::move(bucket), std::move(object_name), std::move(opts), as));
}

future<> client::close() {
    return _ops->close();
}

} // namespace s3stream
