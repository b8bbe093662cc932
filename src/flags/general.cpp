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

#include "flags/general.hpp"

#include "utils/file.hpp"
#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(template_dir, "templates/", "Directory from which templates and the skeleton are loaded.", {
  if (trellis::utils::DirExists(value)) return true;
  std::cout << "Expected --" << flagname << " to be an existing directory, got '" << value << "'" << std::endl;
  return false;
});
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(skeleton, "skeleton.html", "Name of the skeleton template the rendered template is merged into.");

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(context_file, "",
              "Path to a JSON file holding an object whose members are bound in the template context.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(skeleton_context_file, "",
              "Path to a JSON file holding an object whose members are bound in the skeleton context.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(output, "", "Path to which the rendered document is written. Standard output is used when empty.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(annotate_templates, false,
            "Surround included partials with HTML comments naming them and mark which template fills the "
            "skeleton.");
