/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>
#include "s3stream/object_content.hh"
#include "test/lib/chunked_source.hh"
#include "test/lib/log.hh"
#include "test/lib/random_utils.hh"
#include "test/lib/tmpdir.hh"

using namespace seastar;
using namespace s3stream;

static std::string to_string(const segmented_buffer& buf) {
    auto linear = buf.linearize();
    return std::string(linear.get(), linear.size());
}

static void write_file(const fs::path& path, const temporary_buffer<char>& data) {
    auto f = open_file_dma(path.native(), open_flags::wo | open_flags::create | open_flags::truncate).get();
    auto out = make_file_output_stream(std::move(f)).get();
    out.write(data.get(), data.size()).get();
    out.flush().get();
    out.close().get();
}

// Reads the whole content with the given read sizes, cycling through them,
// and checks every read returns as much as requested until the end.
static void check_reads(content_stream& stream, const temporary_buffer<char>& expected, const std::vector<size_t>& read_sizes) {
    std::string result;
    size_t i = 0;
    while (true) {
        auto n = read_sizes[i++ % read_sizes.size()];
        auto buf = stream.read_upto(n).get();
        BOOST_REQUIRE_LE(buf.size(), n);
        BOOST_REQUIRE_EQUAL(buf.size(), std::min(n, expected.size() - result.size()));
        if (buf.empty()) {
            break;
        }
        result += to_string(buf);
    }
    BOOST_REQUIRE_EQUAL(result.size(), expected.size());
    BOOST_REQUIRE(result == std::string_view(expected.get(), expected.size()));

    // end of content is sticky
    BOOST_REQUIRE(stream.read_upto(100).get().empty());
}

static const std::vector<std::vector<size_t>> chunk_patterns = {
    {1},
    {7, 1, 4096},
    {64 * 1024},
    {100 * 1000, 3},
    {1024 * 1024},
};

static const std::vector<std::vector<size_t>> read_patterns = {
    {1000},
    {5, 70000, 1},
    {128 * 1024},
    {3 * 1024 * 1024},
};

SEASTAR_THREAD_TEST_CASE(test_buffer_source_reads) {
    auto data = tests::random::get_buffer(256 * 1024 + 17);
    for (const auto& chunks : chunk_patterns) {
        for (const auto& reads : read_patterns) {
            segmented_buffer content;
            for (size_t pos = 0, i = 0; pos < data.size(); ) {
                auto n = std::min(chunks[i++ % chunks.size()], data.size() - pos);
                content.append(temporary_buffer<char>(data.get() + pos, n));
                pos += n;
            }
            auto stream = object_content(std::move(content)).to_content_stream().get();
            BOOST_REQUIRE(stream.size() == data.size());
            check_reads(stream, data, reads);
            stream.close().get();
        }
    }
}

SEASTAR_THREAD_TEST_CASE(test_stream_source_reads) {
    auto data = tests::random::get_buffer(256 * 1024 + 17);
    for (const auto& chunks : chunk_patterns) {
        for (const auto& reads : read_patterns) {
            auto state = make_lw_shared<tests::chunked_source_state>();
            auto in = tests::make_chunked_stream(data.share(), chunks, state);
            auto stream = object_content::from_stream(std::move(in), std::nullopt).to_content_stream().get();
            BOOST_REQUIRE(!stream.size());
            check_reads(stream, data, reads);
            BOOST_REQUIRE(!state->closed);
            stream.close().get();
            BOOST_REQUIRE(state->closed);
        }
    }
}

SEASTAR_THREAD_TEST_CASE(test_file_source_reads) {
    tmpdir tmp;
    auto path = tmp.path() / "content";
    for (size_t size : {size_t(0), size_t(1), size_t(64 * 1024), size_t(1024 * 1024 + 17)}) {
        auto data = tests::random::get_buffer(size);
        write_file(path, data);
        for (const auto& reads : read_patterns) {
            testlog.debug("file of {} bytes, reads {}", size, reads[0]);
            auto stream = object_content::from_file(path).to_content_stream().get();
            BOOST_REQUIRE(stream.size() == size);
            check_reads(stream, data, reads);
            stream.close().get();
        }
    }
}

SEASTAR_THREAD_TEST_CASE(test_missing_file) {
    tmpdir tmp;
    BOOST_REQUIRE_THROW(object_content::from_file(tmp.path() / "nope").to_content_stream().get(), std::system_error);
}

SEASTAR_THREAD_TEST_CASE(test_read_shares_source_memory) {
    auto data = tests::random::get_buffer(1000);
    const char* ptr = data.get();
    auto stream = object_content::from_buffer(std::move(data)).to_content_stream().get();

    auto first = stream.read_upto(300).get();
    BOOST_REQUIRE_EQUAL(first.segments_count(), 1);
    BOOST_REQUIRE(first.begin()->get() == ptr);

    auto second = stream.read_upto(300).get();
    BOOST_REQUIRE_EQUAL(second.segments_count(), 1);
    BOOST_REQUIRE(second.begin()->get() == ptr + 300);

    auto rest = stream.read_upto(1000).get();
    BOOST_REQUIRE_EQUAL(rest.size(), 400);
    BOOST_REQUIRE(rest.begin()->get() == ptr + 600);
    stream.close().get();
}

SEASTAR_THREAD_TEST_CASE(test_declared_size_is_not_enforced) {
    auto state = make_lw_shared<tests::chunked_source_state>();
    auto in = tests::make_chunked_stream(tests::random::get_buffer(100), {30}, state);
    auto stream = object_content::from_stream(std::move(in), 1000).to_content_stream().get();
    BOOST_REQUIRE(stream.size() == 1000);
    BOOST_REQUIRE_EQUAL(stream.read_upto(1000).get().size(), 100);
    BOOST_REQUIRE(stream.read_upto(1000).get().empty());
    stream.close().get();
}

SEASTAR_THREAD_TEST_CASE(test_source_error_propagates) {
    auto in = tests::make_chunked_stream(tests::random::get_buffer(100), {10}, make_lw_shared<tests::chunked_source_state>(), 50);
    auto stream = object_content::from_stream(std::move(in), std::nullopt).to_content_stream().get();
    BOOST_REQUIRE_EQUAL(stream.read_upto(40).get().size(), 40);
    BOOST_REQUIRE_THROW(stream.read_upto(40).get(), std::runtime_error);
    stream.close().get();
}
