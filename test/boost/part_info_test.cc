/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/testing/test_case.hh>
#include "s3stream/part_info.hh"
#include "s3stream/upload_error.hh"
#include "test/lib/random_utils.hh"

using namespace s3stream;

static constexpr uint64_t KiB = uint64_t(1) << 10;
static constexpr uint64_t MiB = uint64_t(1) << 20;
static constexpr uint64_t GiB = uint64_t(1) << 30;
static constexpr uint64_t TiB = uint64_t(1) << 40;

static void check_error(content_size object_size, content_size part_size, upload_error_type expected) {
    BOOST_REQUIRE_EXCEPTION(calc_part_info(object_size, part_size), upload_exception, [expected] (const upload_exception& e) {
        return e.type() == expected;
    });
}

static void check_info(content_size object_size, content_size part_size, uint64_t expected_part_size, std::optional<unsigned> expected_count) {
    auto info = calc_part_info(object_size, part_size);
    BOOST_REQUIRE_EQUAL(info.part_size, expected_part_size);
    BOOST_REQUIRE(info.part_count == expected_count);
}

BOOST_AUTO_TEST_CASE(test_part_size_bounds) {
    check_error(std::nullopt, 5 * MiB - 1, upload_error_type::INVALID_PART_SIZE);
    check_error(100 * MiB, 1 * MiB, upload_error_type::INVALID_PART_SIZE);
    check_error(100 * MiB, 5 * GiB + 1, upload_error_type::INVALID_PART_SIZE);
    check_info(std::nullopt, 5 * MiB, 5 * MiB, std::nullopt);
    check_info(std::nullopt, 5 * GiB, 5 * GiB, std::nullopt);
}

BOOST_AUTO_TEST_CASE(test_object_size_bound) {
    check_error(5 * TiB + 1, std::nullopt, upload_error_type::INVALID_OBJECT_SIZE);
    check_error(5 * TiB + 1, 1 * GiB, upload_error_type::INVALID_OBJECT_SIZE);
    check_info(5 * TiB, std::nullopt, 525 * MiB, 9987);
}

BOOST_AUTO_TEST_CASE(test_unknown_object_size) {
    check_error(std::nullopt, std::nullopt, upload_error_type::MISSING_PART_SIZE);
    check_info(std::nullopt, 16 * MiB, 16 * MiB, std::nullopt);
}

BOOST_AUTO_TEST_CASE(test_part_size_from_object_size) {
    // small objects go in one part of their own size
    check_info(1 * MiB, std::nullopt, 1 * MiB, 1);
    check_info(0, std::nullopt, 0, 1);
    check_info(1, std::nullopt, 1, 1);
    check_info(5 * MiB, std::nullopt, 5 * MiB, 1);
    check_info(5 * MiB + 1, std::nullopt, 5 * MiB, 2);
    check_info(12 * MiB, std::nullopt, 5 * MiB, 3);

    auto info = calc_part_info(60 * GiB, std::nullopt);
    BOOST_REQUIRE_GE(info.part_size, aws_minimum_part_size);
    BOOST_REQUIRE_EQUAL(info.part_size % aws_minimum_part_size, 0);
    BOOST_REQUIRE(info.part_count);
    BOOST_REQUIRE_LE(*info.part_count, aws_maximum_parts_in_piece);
    BOOST_REQUIRE_GE(info.part_size * *info.part_count, 60 * GiB);
}

BOOST_AUTO_TEST_CASE(test_explicit_part_size) {
    check_info(12 * MiB, 5 * MiB, 5 * MiB, 3);
    check_info(10 * MiB, 5 * MiB, 5 * MiB, 2);
    check_info(1, 5 * MiB, 5 * MiB, 1);
    // zero parts is not an upload
    check_error(0, 5 * MiB, upload_error_type::INVALID_PART_COUNT);
    check_info(10'000 * 5 * MiB, 5 * MiB, 5 * MiB, 10'000);
    check_error(10'000 * 5 * MiB + 1, 5 * MiB, upload_error_type::INVALID_PART_COUNT);
}

BOOST_AUTO_TEST_CASE(test_error_type_names) {
    BOOST_REQUIRE_EQUAL(fmt::to_string(upload_error_type::INSUFFICIENT_DATA), "InsufficientData");
    BOOST_REQUIRE_EQUAL(fmt::to_string(upload_error_type::TOO_MANY_PARTS), "TooManyParts");
    BOOST_REQUIRE_EQUAL(fmt::to_string(upload_error_type::MISSING_PART_SIZE), "MissingPartSize");
}

// Parts computed for any valid object size cover the object and stay
// within the part size and count limits.
BOOST_AUTO_TEST_CASE(test_auto_part_size_sweep) {
    std::vector<uint64_t> sizes = {1, 5 * MiB - 1, 5 * MiB, 5 * MiB + 1, 50 * GiB, 48828125 * KiB, 5 * TiB - 1, 5 * TiB};
    for (int i = 0; i < 1000; i++) {
        sizes.push_back(tests::random::get_int<uint64_t>(1, aws_maximum_object_size));
    }

    for (auto size : sizes) {
        auto info = calc_part_info(size, std::nullopt);
        BOOST_REQUIRE(info.part_count);
        auto count = *info.part_count;
        BOOST_REQUIRE_GE(count, 1);
        BOOST_REQUIRE_LE(count, aws_maximum_parts_in_piece);
        BOOST_REQUIRE_LE(info.part_size, aws_maximum_part_size);
        BOOST_REQUIRE_LE(info.part_size, size);
        BOOST_REQUIRE_GE(info.part_size * count, size);
        BOOST_REQUIRE_LT(info.part_size * (count - 1), size);
        if (size >= aws_minimum_part_size) {
            BOOST_REQUIRE_GE(info.part_size, aws_minimum_part_size);
        }
        BOOST_REQUIRE(calc_part_info(size, std::nullopt) == info);
    }
}

BOOST_AUTO_TEST_CASE(test_explicit_part_size_sweep) {
    for (int i = 0; i < 1000; i++) {
        auto part_size = tests::random::get_int<uint64_t>(aws_minimum_part_size, aws_maximum_part_size);
        auto object_size = tests::random::get_int<uint64_t>(1, part_size * aws_maximum_parts_in_piece);
        if (object_size > aws_maximum_object_size) {
            check_error(object_size, part_size, upload_error_type::INVALID_OBJECT_SIZE);
            continue;
        }
        auto info = calc_part_info(object_size, part_size);
        BOOST_REQUIRE_EQUAL(info.part_size, part_size);
        BOOST_REQUIRE(info.part_count);
        BOOST_REQUIRE_GE(uint64_t(*info.part_count) * part_size, object_size);
        BOOST_REQUIRE_LT(uint64_t(*info.part_count - 1) * part_size, object_size);
    }
}
