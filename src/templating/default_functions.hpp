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

#include <string>
#include <string_view>
#include <vector>

#include "expr/context.hpp"
#include "expr/typed_value.hpp"

namespace trellis::templating {

/// Keeps the members of `object` whose key is kept by the first glob in
/// `filters` that matches it. A filter starting with `-` rejects the keys it
/// matches; keys no filter matches are rejected, so `["-secret", "*"]` keeps
/// everything but `secret`.
/// @throw TemplateFunctionException on an empty filter.
expr::TypedValue FilterKeys(const expr::TypedValue &object, const std::vector<std::string> &filters);

/// `YYYY-MM-DD...` as `MM/DD/YYYY`. Shorter input is returned as is.
std::string FormatDate(std::string_view date);

/// Full English name of the weekday of `YYYY-MM-DD...`.
/// @throw utils::temporal::InvalidArgumentException
std::string DayOfWeek(std::string_view date);

/// `YYYY-MM-DDTHH:MM:SS...` as `H:MM AM` or `H:MM PM`. Input shorter than 20
/// characters is returned as is.
/// @throw utils::temporal::InvalidArgumentException
std::string FormatTime(std::string_view date_time);

/// Binds `filterKeys`, `encodeURIComponent`, `formatDate`, `dayOfWeek` and
/// `formatTime` in `context`, and binds `meta` and `data` to empty maps unless
/// they already hold a value.
void AddDefaultFunctions(expr::Context &context);

}  // namespace trellis::templating
