/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <concepts>

namespace s3stream::utils {

template <std::unsigned_integral T>
constexpr T div_ceil(T dividend, T divisor) noexcept {
    return dividend / divisor + (dividend % divisor != 0);
}

} // namespace s3stream::utils
