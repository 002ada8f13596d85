/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include "multipart_upload.hh"
#include "s3stream/object_content.hh"

namespace s3stream {

// Uploads an object_content, either with a single PUT, when everything fits
// into one part, or part by part in a multipart upload. Parts are read and
// sent one at a time.
//
// On any failure after the multipart upload was created the upload is
// aborted and the original error is rethrown. The abort source, if given,
// is checked before every part.
class put_object_content : private multipart_upload {
    object_content _content;
    content_size _part_size;

    seastar::future<upload_outcome> do_upload(content_stream& stream);

    seastar::future<upload_outcome> put_object(segmented_buffer buf);

    seastar::future<upload_outcome> multi_part_upload(content_stream& stream, part_info info, segmented_buffer first_part);

    seastar::future<> upload_parts(content_stream& stream, part_info info, segmented_buffer first_part);

public:
    put_object_content(seastar::shared_ptr<remote_upload_ops> ops,
                       seastar::sstring bucket,
                       seastar::sstring object_name,
                       object_content content,
                       upload_options opts,
                       seastar::abort_source* as);

    seastar::future<upload_outcome> upload();
};

} // namespace s3stream
