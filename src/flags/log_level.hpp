// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <optional>
#include <string_view>

#include <spdlog/common.h>

#include "gflags/gflags.h"

DECLARE_string(log_level);
DECLARE_string(log_file);

namespace lize::flags {

bool ValidLogLevel(std::string_view value);
std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value);

/// Replaces the default logger with one that writes to stderr and, if
/// `--log_file` is set, to that file. Must be called after the flags were
/// parsed.
void InitializeLogger();

}  // namespace lize::flags
