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

#include <iostream>
#include <string>

#include <gflags/gflags.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "expr/context.hpp"
#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "templating/exceptions.hpp"
#include "templating/loader.hpp"
#include "templating/renderer.hpp"
#include "utils/file.hpp"

namespace {

// Binds every member of the JSON object stored in `path`. An empty path binds
// nothing.
bool LoadContextFile(const std::string &path, trellis::expr::Context *context) {
  if (path.empty()) return true;

  auto text = trellis::utils::ReadText(path);
  if (!text) {
    spdlog::error("Unable to read the context file {}", path);
    return false;
  }

  nlohmann::ordered_json json;
  try {
    json = nlohmann::ordered_json::parse(*text);
  } catch (const nlohmann::json::parse_error &e) {
    spdlog::error("The context file {} is not valid JSON: {}", path, e.what());
    return false;
  }
  if (!json.is_object()) {
    spdlog::error("The context file {} has to hold a JSON object, not {}", path, json.type_name());
    return false;
  }

  for (const auto &[name, value] : json.items()) {
    context->Set(name, trellis::expr::TypedValue::FromJson(value));
  }
  spdlog::debug("Loaded {} bindings from {}", json.size(), path);
  return true;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(
      "Render an HTML template inside a skeleton page.\n"
      "Usage: trellis [flags] <template-name>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  trellis::flags::InitializeLogger();

  if (argc != 2) {
    gflags::ShowUsageWithFlags(argv[0]);
    return 1;
  }
  const std::string template_name(argv[1]);

  trellis::expr::Context context;
  trellis::expr::Context skeleton_context;
  if (!LoadContextFile(FLAGS_context_file, &context)) return 1;
  if (!LoadContextFile(FLAGS_skeleton_context_file, &skeleton_context)) return 1;

  trellis::templating::DirectoryTemplateLoader loader(FLAGS_template_dir);
  trellis::templating::WebTemplateRenderer renderer(
      loader, {}, {.default_skeleton = FLAGS_skeleton, .annotate_templates = FLAGS_annotate_templates});

  std::string html;
  try {
    html = renderer.RenderTemplate(template_name, context, skeleton_context).ToHtml();
  } catch (const trellis::templating::RenderException &e) {
    spdlog::error("{} ({})", e.what(), e.cause_name());
    return 1;
  }

  if (FLAGS_output.empty()) {
    std::cout << html;
    return 0;
  }
  if (!trellis::utils::WriteText(FLAGS_output, html)) {
    spdlog::error("Unable to write the rendered document to {}", FLAGS_output);
    return 1;
  }
  spdlog::info("Rendered {} to {}", template_name, FLAGS_output);
  return 0;
}
