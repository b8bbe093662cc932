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

#include "expr/context.hpp"
#include "utils/exceptions.hpp"

namespace trellis::templating {

/// A marker or the template markup itself cannot be parsed.
class MalformedTemplateException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(MalformedTemplateException)
};

/// The loader has no template under the requested name.
class MissingTemplateException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(MissingTemplateException)
};

/// The content document cannot be merged into the skeleton, e.g. because an
/// element the merge needs is missing.
class StructuralMergeException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(StructuralMergeException)
};

/// Invalid arguments to one of the functions bound by AddDefaultFunctions.
class TemplateFunctionException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(TemplateFunctionException)
};

/**
 * Raised by WebTemplateRenderer::RenderTemplate for any failure while
 * rendering. Keeps the name of the template, the bindings of the content
 * context at the time of failure and the name and message of the original
 * exception.
 */
class RenderException : public utils::BasicException {
 public:
  RenderException(std::string template_name, expr::Context context, std::string cause_name,
                  std::string_view cause_message)
      : utils::BasicException("Exception in template {}: {}", template_name, cause_message),
        template_name_(std::move(template_name)),
        context_(std::move(context)),
        cause_name_(std::move(cause_name)),
        cause_message_(cause_message) {}

  const std::string &template_name() const { return template_name_; }
  const expr::Context &context() const { return context_; }
  const std::string &cause_name() const { return cause_name_; }
  const std::string &cause_message() const { return cause_message_; }

  SPECIALIZE_GET_EXCEPTION_NAME(RenderException)

 private:
  std::string template_name_;
  expr::Context context_;
  std::string cause_name_;
  std::string cause_message_;
};

}  // namespace trellis::templating
