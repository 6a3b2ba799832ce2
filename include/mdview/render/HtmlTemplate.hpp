#pragma once

#include "mdview/render/PipelineError.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mdview::render {

/// Where a template value lands in the document, which decides how it is made safe.
enum class SlotContext : uint8_t {
    /// Inside a <style> element. Inserted verbatim after validateCss().
    Css,
    /// HTML text or quoted attribute value. Inserted through htmlEscape().
    Text,
};

struct TemplateValue {
    SlotContext context = SlotContext::Text;
    std::string value;
};

using TemplateValues = std::map<std::string, TemplateValue, std::less<>>;

/// Escapes & < > " ' for HTML text and attribute positions.
[[nodiscard]] std::string htmlEscape(std::string_view input);

/// Rejects CSS that could terminate the enclosing <style> element.
std::expected<void, std::string> validateCss(std::string_view css);

/// Replaces every {{name}} placeholder in `tmpl` with the named value.
/// Unknown names, malformed or unterminated placeholders and unsafe CSS values
/// are reported as TemplateError; nothing partial is returned.
std::expected<std::string, PipelineError> expandTemplate(std::string_view tmpl, const TemplateValues& values);

}  // namespace mdview::render
