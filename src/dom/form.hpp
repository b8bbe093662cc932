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
#include <vector>

#include "dom/node.hpp"

namespace trellis::dom {

/// `input`, `textarea` and `select` descendants of `form` named `name`, in
/// document order.
std::vector<Element *> FindFormControls(const Node &form, std::string_view name);

/**
 * Sets the value of the form field `name`.
 *
 * Checkboxes and radio buttons are checked when their value equals `value`
 * and unchecked otherwise, other inputs get their `value` attribute, text
 * areas their text and selects mark the matching option as selected. When the
 * form has no control with that name a hidden input carrying the value is
 * appended to it.
 */
void SetFormValue(Element &form, std::string_view name, std::string_view value);

}  // namespace trellis::dom
