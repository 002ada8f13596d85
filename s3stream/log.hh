/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <seastar/util/log.hh>

namespace s3stream {

extern seastar::logger s3l;

} // namespace s3stream
