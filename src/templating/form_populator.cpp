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

#include "templating/form_populator.hpp"

#include <string>

#include "dom/form.hpp"
#include "utils/string.hpp"

namespace trellis::templating {

namespace {

std::string ItemFieldName(std::string_view field_name, const std::string &key) {
  if (field_name.find('%') != std::string_view::npos) return utils::Replace(field_name, "%", key);
  return fmt::format("{}[{}]", field_name, key);
}

}  // namespace

void PopulateForm(dom::Element &form, const expr::TypedValue &value, std::string_view field_name) {
  if (!value.IsMap() && !value.IsList()) {
    dom::SetFormValue(form, field_name, value.ToText());
    return;
  }
  dom::SetFormValue(form, field_name, "");
  for (const auto &[key, item] : value.Items()) {
    PopulateForm(form, item, ItemFieldName(field_name, key.ToText()));
  }
}

}  // namespace trellis::templating
