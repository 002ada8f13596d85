/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/chrono.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/on_internal_error.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/exception.hh>
#include <seastar/http/url.hh>
#include <seastar/util/short_streams.hh>
#include "http_upload_ops.hh"
#include "log.hh"
#include "upload_error.hh"
#include "utils/client_utils.hh"
#include "utils/http.hh"

using namespace seastar;

namespace s3stream {

static future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_) {
    auto in = std::move(in_);
    co_await util::skip_entire_stream(in);
}

static void write_body(http::request& req, segmented_buffer body) {
    auto len = body.size();
    req.write_body("bin", len, [body = std::move(body)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            for (const auto& buf : body) {
                co_await out.write(buf.get(), buf.size());
            }
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });
}

static sstring encode_tags(const tag_set& tags) {
    sstring tagging;
    for (const auto& t : tags) {
        tagging += seastar::format("{}{}={}", tagging.empty() ? "" : "&", http::internal::url_encode(t.key), http::internal::url_encode(t.value));
    }
    return tagging;
}

static std::string_view to_string(retention_mode mode) {
    switch (mode) {
    case retention_mode::GOVERNANCE: return "GOVERNANCE";
    case retention_mode::COMPLIANCE: return "COMPLIANCE";
    }
    on_internal_error(s3l, fmt::format("unknown retention mode {}", static_cast<int>(mode)));
}

static sstring to_iso8601utc(std::chrono::system_clock::time_point tp) {
    return seastar::format("{:%Y-%m-%dT%H:%M:%S}.000Z", fmt::gmtime(std::chrono::system_clock::to_time_t(tp)));
}

// Headers of the requests that create an object, a simple PUT or the
// creation of a multipart upload
static void set_metadata_headers(http::request& req, const object_metadata& meta) {
    req._headers["Content-Type"] = meta.content_type;
    for (const auto& [key, value] : meta.user_metadata) {
        req._headers[seastar::format("x-amz-meta-{}", key)] = value;
    }
    if (!meta.tags.empty()) {
        req._headers["x-amz-tagging"] = encode_tags(meta.tags);
    }
    if (meta.retention) {
        req._headers["x-amz-object-lock-mode"] = sstring(to_string(meta.retention->mode));
        req._headers["x-amz-object-lock-retain-until-date"] = to_iso8601utc(meta.retention->retain_until);
    }
    if (meta.legal_hold) {
        req._headers["x-amz-object-lock-legal-hold"] = "ON";
    }
    if (meta.sse) {
        if (meta.sse->kms_key_id) {
            req._headers["x-amz-server-side-encryption"] = "aws:kms";
            req._headers["x-amz-server-side-encryption-aws-kms-key-id"] = *meta.sse->kms_key_id;
        } else {
            req._headers["x-amz-server-side-encryption"] = meta.sse->algorithm;
        }
    }
}

static sstring etag_of(const http::reply& rep, std::string_view what) {
    auto etag = rep.get_header("ETag");
    if (etag.empty()) {
        throw upload_exception(upload_error_type::INVALID_RESPONSE, fmt::format("{} reply carries no ETag", what));
    }
    return etag;
}

static endpoint_config_ptr check_endpoint(endpoint_config_ptr cfg) {
    if (cfg->use_https) {
        throw std::invalid_argument(fmt::format("HTTPS endpoints are not supported ({})", cfg->host));
    }
    return cfg;
}

http_upload_ops::http_upload_ops(endpoint_config_ptr cfg)
        : _cfg(check_endpoint(std::move(cfg)))
        , _http(std::make_unique<utils::http::dns_connection_factory>(_cfg->host, _cfg->port, s3l),
                _cfg->max_connections.value_or(http::experimental::client::default_max_connections))
{}

// Every segment of the key is url-encoded, the separating slashes are kept
static sstring encode_object_key(std::string_view key) {
    sstring encoded;
    size_t pos = 0;
    while (true) {
        auto next = key.find('/', pos);
        encoded += http::internal::url_encode(key.substr(pos, next == std::string_view::npos ? next : next - pos));
        if (next == std::string_view::npos) {
            break;
        }
        encoded += "/";
        pos = next + 1;
    }
    return encoded;
}

sstring http_upload_ops::object_path(const sstring& bucket, const sstring& object_name) const {
    return seastar::format("/{}/{}", bucket, encode_object_key(object_name));
}

future<> http_upload_ops::make_request(http::request req, http::experimental::client::reply_handler handle, http::reply::status_type expected) {
    co_await _http.make_request(std::move(req), [handler = std::move(handle), expected] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        auto payload = std::move(in);
        auto status_class = http::reply::classify_status(rep._status);

        if (status_class != http::reply::status_class::informational && status_class != http::reply::status_class::success) {
            auto status = static_cast<int>(rep._status);
            auto body = co_await util::read_entire_stream_contiguous(payload);
            auto possible_error = parse_error_response(status, body);
            if (possible_error) {
                co_await coroutine::return_exception(std::move(*possible_error));
            }
            co_await coroutine::return_exception(remote_error(status, "", fmt::format("S3 request failed with status {}", status)));
        }

        if (rep._status != expected) {
            co_await util::skip_entire_stream(payload);
            co_await coroutine::return_exception(httpd::unexpected_status_error(rep._status));
        }
        co_await handler(rep, std::move(payload));
    }, std::nullopt);
}

future<sstring> http_upload_ops::create_multipart_upload(const sstring& bucket, const sstring& object_name, const object_metadata& meta) {
    auto path = object_path(bucket, object_name);
    s3l.trace("POST uploads {}", path);
    auto req = http::request::make("POST", _cfg->host, path);
    req.query_parameters["uploads"] = "";
    set_metadata_headers(req, meta);

    sstring upload_id;
    co_await make_request(std::move(req), [&upload_id] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        upload_id = parse_multipart_upload_id(body);
    }, http::reply::status_type::ok);
    co_return upload_id;
}

future<sstring> http_upload_ops::upload_part(const sstring& bucket, const sstring& object_name, const sstring& upload_id, unsigned part_number,
                                             segmented_buffer body) {
    auto path = object_path(bucket, object_name);
    s3l.trace("PUT part {}, {} bytes in {} buffers (upload id {})", part_number, body.size(), body.segments_count(), upload_id);
    auto req = http::request::make("PUT", _cfg->host, path);
    req.query_parameters.emplace("partNumber", to_sstring(part_number));
    req.query_parameters.emplace("uploadId", upload_id);
    write_body(req, std::move(body));

    sstring etag;
    co_await make_request(std::move(req), [&etag] (const http::reply& rep, input_stream<char>&& in) {
        etag = etag_of(rep, "upload part");
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok);
    s3l.trace("Uploaded part {}, etag={}", part_number, etag);
    co_return etag;
}

future<completed_upload> http_upload_ops::complete_multipart_upload(const sstring& bucket, const sstring& object_name, const sstring& upload_id,
                                                                    const std::vector<part_descriptor>& parts) {
    auto path = object_path(bucket, object_name);
    s3l.trace("POST upload completion {} parts (upload id {})", parts.size(), upload_id);
    auto req = http::request::make("POST", _cfg->host, path);
    req.query_parameters.emplace("uploadId", upload_id);
    auto parts_xml_len = prepare_multipart_upload_parts(parts);
    req.write_body("xml", parts_xml_len, [parts] (output_stream<char>&& out) -> future<> {
        return dump_multipart_upload_parts(std::move(out), parts);
    });

    completed_upload ret{.size = 0};
    for (const auto& p : parts) {
        ret.size += p.size;
    }
    co_await make_request(std::move(req), [&ret] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        ret.etag = parse_multipart_complete_etag(static_cast<int>(rep._status), body);
    }, http::reply::status_type::ok);
    co_return ret;
}

future<> http_upload_ops::abort_multipart_upload(const sstring& bucket, const sstring& object_name, const sstring& upload_id) {
    auto path = object_path(bucket, object_name);
    s3l.trace("DELETE upload {}", upload_id);
    auto req = http::request::make("DELETE", _cfg->host, path);
    req.query_parameters["uploadId"] = upload_id;
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::no_content);
}

future<sstring> http_upload_ops::put_object(const sstring& bucket, const sstring& object_name, segmented_buffer body, const object_metadata& meta) {
    auto path = object_path(bucket, object_name);
    s3l.trace("PUT {} ({} bytes)", path, body.size());
    auto req = http::request::make("PUT", _cfg->host, path);
    write_body(req, std::move(body));
    set_metadata_headers(req, meta);

    sstring etag;
    co_await make_request(std::move(req), [&etag] (const http::reply& rep, input_stream<char>&& in) {
        etag = etag_of(rep, "put object");
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok);
    co_return etag;
}

future<> http_upload_ops::close() {
    return _http.close();
}

} // namespace s3stream
