#pragma once

#include "mdview/render/PipelineError.hpp"

#include <expected>
#include <ostream>
#include <string_view>

namespace mdview::render {

struct ConvertOptions {
    /// Soft line breaks inside a paragraph become <br>.
    bool hardWraps = true;
    /// Pass raw HTML blocks and inline tags through instead of escaping them.
    bool allowRawHtml = false;
};

/// md4c parser flags for the given options. Always includes the GitHub dialect
/// (tables, strikethrough, permissive autolinks, task lists).
[[nodiscard]] unsigned parserFlags(const ConvertOptions& options);

/// Converts Markdown to an HTML fragment, streaming the output into `out` as it
/// is produced. Output already written stays in `out` if the conversion fails.
std::expected<void, PipelineError> convertMarkdown(std::string_view markdown, std::ostream& out,
                                                   const ConvertOptions& options = {});

}  // namespace mdview::render
