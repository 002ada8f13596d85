/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include "client_utils.hh"
#include "s3stream/log.hh"

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";

static constexpr std::string_view multipart_upload_complete_entry = "<Part><ETag>{}</ETag><PartNumber>{}</PartNumber></Part>";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace s3stream {

using namespace seastar;

static std::unique_ptr<rapidxml::xml_document<>> parse_xml(sstring& body, std::string_view what) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse {} response: {}", what, e.what());
        throw upload_exception(upload_error_type::INVALID_RESPONSE, fmt::format("cannot parse {} response", what));
    }
    return doc;
}

sstring parse_multipart_upload_id(sstring& body) {
    auto doc = parse_xml(body, "initiate multipart upload");
    auto uploadid_node = first_node_of(doc.get(), {"InitiateMultipartUploadResult", "UploadId"});
    return uploadid_node->value();
}

static remote_error make_remote_error(int status, rapidxml::xml_node<>* error_node) {
    auto code = error_node->first_node("Code");
    auto message = error_node->first_node("Message");
    return remote_error(status, code ? code->value() : "",
                        fmt::format("S3 request failed with status {}. Code: {}. Reason: {}", status, code ? code->value() : "unknown",
                                    message ? message->value() : ""));
}

sstring parse_multipart_complete_etag(int status, sstring& body) {
    auto doc = parse_xml(body, "complete multipart upload");
    if (auto error_node = doc->first_node("Error")) {
        throw make_remote_error(status, error_node);
    }
    auto etag_node = first_node_of(doc.get(), {"CompleteMultipartUploadResult", "ETag"});
    return etag_node->value();
}

std::optional<remote_error> parse_error_response(int status, sstring& body) {
    if (body.empty()) {
        return std::nullopt;
    }
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.debug("cannot parse error response: {}", e.what());
        return std::nullopt;
    }
    auto root = doc->first_node("Error");
    if (!root) {
        return std::nullopt;
    }
    return make_remote_error(status, root);
}

unsigned prepare_multipart_upload_parts(const std::vector<part_descriptor>& parts) {
    unsigned ret = multipart_upload_complete_header.size();

    for (auto& part : parts) {
        // length of the format string - four braces + length of the etag + length of the number
        ret += multipart_upload_complete_entry.size() - 4 + part.etag.size() + fmt::formatted_size("{}", part.number);
    }
    ret += multipart_upload_complete_trailer.size();
    return ret;
}

future<> dump_multipart_upload_parts(output_stream<char> out, const std::vector<part_descriptor>& parts) {
    std::exception_ptr ex;
    try {
        co_await out.write(multipart_upload_complete_header.data(), multipart_upload_complete_header.size());

        for (auto& part : parts) {
            co_await out.write(fmt::format(fmt::runtime(multipart_upload_complete_entry), part.etag, part.number));
        }
        co_await out.write(multipart_upload_complete_trailer.data(), multipart_upload_complete_trailer.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names) {
    auto* node = root;
    for (auto name : names) {
        node = node->first_node(name.data(), name.size());
        if (!node) {
            throw upload_exception(upload_error_type::INVALID_RESPONSE, fmt::format("'{}' is not found", name));
        }
    }
    return node;
}

} // namespace s3stream
