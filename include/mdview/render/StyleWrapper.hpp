#pragma once

#include "mdview/render/PipelineError.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mdview::render {

/// Built-in stylesheet (GitHub light Markdown theme).
std::string_view githubMarkdownCss();

/// Document template written before the converted body. {{css}} is a CSS slot.
std::string_view documentPreambleTemplate();

/// Closing boilerplate written after the converted body.
std::string_view documentSuffix();

/// Expands the preamble with `css`. Fails with TemplateError, never with a
/// partial document.
std::expected<std::string, PipelineError> buildPreamble(std::string_view css);

/// Reads a replacement stylesheet, or returns the built-in one when `path` is
/// unset. An unreadable file is a TemplateError.
std::expected<std::string, PipelineError> loadStylesheet(const std::optional<std::filesystem::path>& path);

/// Wraps a converted body in the styled document. The sink sees the preamble,
/// then whatever the caller writes, then the suffix once finish() is called.
class StyleWrapper {
public:
    explicit StyleWrapper(std::string css);

    std::expected<void, PipelineError> begin(std::ostream& out) const;
    std::expected<void, PipelineError> finish(std::ostream& out) const;

private:
    std::string css_;
};

}  // namespace mdview::render
