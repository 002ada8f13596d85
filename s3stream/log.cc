/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "log.hh"

namespace s3stream {

seastar::logger s3l("s3stream");

} // namespace s3stream
