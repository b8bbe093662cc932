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

#include <string_view>

#include "dom/node.hpp"
#include "expr/typed_value.hpp"

namespace trellis::templating {

/**
 * Writes `value` into `form` as flat form fields.
 *
 * Scalars set the field `field_name` directly. Maps and lists first set
 * `field_name` to an empty value and then recurse into their items: the
 * field name of an item is `field_name` with every `%` replaced by the item's
 * key, or `field_name[key]` when `field_name` has no `%`. So
 * `{"a": {"b": 1}}` under `x` produces the fields `x`, `x[a]` and `x[a][b]`.
 */
void PopulateForm(dom::Element &form, const expr::TypedValue &value, std::string_view field_name);

}  // namespace trellis::templating
