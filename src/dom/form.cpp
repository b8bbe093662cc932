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

#include "dom/form.hpp"

#include <string>

#include "utils/string.hpp"

namespace trellis::dom {

namespace {

bool IsFormControl(const Element &element) {
  const auto &tag = element.tag_name();
  return tag == "input" || tag == "textarea" || tag == "select";
}

void SetSelected(Element &select, std::string_view value) {
  for (auto *option : FindAllByTagName(select, "option")) {
    auto option_value = option->FindAttribute("value").value_or(std::string(utils::Trim(option->TextContent())));
    if (option_value == value) {
      option->SetAttribute("selected", "selected");
    } else {
      option->RemoveAttribute("selected");
    }
  }
}

void SetControlValue(Element &control, std::string_view value) {
  if (control.tag_name() == "textarea") {
    control.SetInnerText(std::string(value));
    return;
  }
  if (control.tag_name() == "select") {
    SetSelected(control, value);
    return;
  }
  auto type = utils::ToLowerCase(control.GetAttribute("type"));
  if (type == "checkbox" || type == "radio") {
    // Browsers submit "on" for a checkbox without a value.
    if (control.FindAttribute("value").value_or("on") == value) {
      control.SetAttribute("checked", "checked");
    } else {
      control.RemoveAttribute("checked");
    }
    return;
  }
  control.SetAttribute("value", std::string(value));
}

}  // namespace

std::vector<Element *> FindFormControls(const Node &form, std::string_view name) {
  return FindAll(form, [name](const Element &element) {
    if (!IsFormControl(element)) return false;
    auto control_name = element.FindAttribute("name");
    return control_name && *control_name == name;
  });
}

void SetFormValue(Element &form, std::string_view name, std::string_view value) {
  auto controls = FindFormControls(form, name);
  if (controls.empty()) {
    form.AppendChild(std::make_unique<Element>(
        "input", Attributes{{"type", "hidden"}, {"name", std::string(name)}, {"value", std::string(value)}}));
    return;
  }
  for (auto *control : controls) SetControlValue(*control, value);
}

}  // namespace trellis::dom
