#include "mdview/render/HtmlTemplate.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace mdview::render {
namespace {

constexpr std::string_view kOpen = "{{";
constexpr std::string_view kClose = "}}";

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

bool isValidName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char ch) {
        const auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) != 0 || c == '_';
    });
}

PipelineError templateError(std::string message) {
    return PipelineError{ErrorKind::TemplateError, std::move(message)};
}

}  // namespace

std::string htmlEscape(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 16);
    for (const char ch : input) {
        switch (ch) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#39;";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

std::expected<void, std::string> validateCss(std::string_view css) {
    if (css.find('\0') != std::string_view::npos) {
        return std::unexpected("stylesheet contains a NUL byte");
    }

    constexpr std::string_view kStyleEnd = "</style";
    std::string lowered(css);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
    if (const auto pos = lowered.find(kStyleEnd); pos != std::string::npos) {
        return std::unexpected(std::format("stylesheet closes the <style> element at offset {}", pos));
    }
    return {};
}

std::expected<std::string, PipelineError> expandTemplate(std::string_view tmpl, const TemplateValues& values) {
    std::string out;
    out.reserve(tmpl.size());

    size_t cursor = 0;
    while (cursor < tmpl.size()) {
        const auto open = tmpl.find(kOpen, cursor);
        if (open == std::string_view::npos) {
            out.append(tmpl.substr(cursor));
            break;
        }
        out.append(tmpl.substr(cursor, open - cursor));

        const auto nameStart = open + kOpen.size();
        const auto close = tmpl.find(kClose, nameStart);
        if (close == std::string_view::npos) {
            return std::unexpected(templateError(std::format("unterminated placeholder at offset {}", open)));
        }

        const auto name = trim(tmpl.substr(nameStart, close - nameStart));
        if (!isValidName(name)) {
            return std::unexpected(templateError(std::format("malformed placeholder '{}' at offset {}",
                                                             tmpl.substr(open, close + kClose.size() - open), open)));
        }

        const auto it = values.find(name);
        if (it == values.end()) {
            return std::unexpected(templateError(std::format("no value for placeholder '{}'", name)));
        }

        const auto& value = it->second;
        switch (value.context) {
        case SlotContext::Css: {
            auto valid = validateCss(value.value);
            if (!valid.has_value()) {
                return std::unexpected(templateError(std::format("value for '{}': {}", name, valid.error())));
            }
            out.append(value.value);
            break;
        }
        case SlotContext::Text:
            out.append(htmlEscape(value.value));
            break;
        }

        cursor = close + kClose.size();
    }

    return out;
}

}  // namespace mdview::render
