// Single-pass template scanner.

#include "vargen/template.h"

#include "vargen/error.h"

#include <fmt/format.h>

#include <optional>
#include <utility>

namespace vargen {
namespace {

bool is_special(char ch) { return ch == '[' || ch == ']' || ch == '|' || ch == '\\'; }

void append_escaped(std::string &out, std::string_view text) {
    for (char ch : text) {
        if (is_special(ch)) {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
}

} // namespace

std::size_t Template::group_count() const {
    std::size_t count = 0;
    for (const auto &segment : segments) {
        if (std::holds_alternative<ChoiceGroup>(segment))
            ++count;
    }
    return count;
}

Template parse_template(std::string_view text) {
    Template    out;
    std::string literal;

    // Set while scanning a group.
    std::optional<std::size_t> group_start;
    ChoiceGroup                group;
    std::string                alternative;

    auto flush_literal = [&] {
        if (!literal.empty()) {
            out.segments.emplace_back(Literal{std::move(literal)});
            literal.clear();
        }
    };
    auto current = [&]() -> std::string & { return group_start ? alternative : literal; };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '\\') {
            if (i + 1 < text.size() && is_special(text[i + 1])) {
                current().push_back(text[i + 1]);
                ++i;
            } else {
                current().push_back('\\');
            }
            continue;
        }

        if (!group_start) {
            switch (ch) {
            case '[':
                flush_literal();
                group_start = i;
                break;
            case ']':
                throw error(ErrorKind::MalformedTemplate, fmt::format("unmatched ']' at position {}", i), i);
            default: literal.push_back(ch); break;
            }
            continue;
        }

        switch (ch) {
        case '|':
            group.alternatives.push_back(std::move(alternative));
            alternative.clear();
            break;
        case ']':
            group.alternatives.push_back(std::move(alternative));
            alternative.clear();
            out.segments.emplace_back(std::move(group));
            group = ChoiceGroup{};
            group_start.reset();
            break;
        default:
            // '[' lands here too: groups do not nest.
            alternative.push_back(ch);
            break;
        }
    }

    if (group_start) {
        throw error(ErrorKind::MalformedTemplate, fmt::format("unmatched '[' at position {}", *group_start), *group_start);
    }
    flush_literal();
    return out;
}

void validate_template(const Template &tpl) {
    std::size_t group_index = 0;
    for (const auto &segment : tpl.segments) {
        const auto *group = std::get_if<ChoiceGroup>(&segment);
        if (group == nullptr)
            continue;
        if (group->alternatives.empty()) {
            throw error(ErrorKind::EmptyChoiceGroup, fmt::format("choice group #{} has no alternatives", group_index));
        }
        ++group_index;
    }
}

std::string escape_template_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    append_escaped(out, text);
    return out;
}

std::string render_template_text(const Template &tpl) {
    std::string out;
    for (const auto &segment : tpl.segments) {
        if (const auto *lit = std::get_if<Literal>(&segment)) {
            append_escaped(out, lit->text);
            continue;
        }
        const auto &alternatives = std::get<ChoiceGroup>(segment).alternatives;
        if (alternatives.empty()) {
            throw error(ErrorKind::EmptyChoiceGroup, "cannot render a choice group without alternatives");
        }
        out.push_back('[');
        for (std::size_t i = 0; i < alternatives.size(); ++i) {
            if (i != 0)
                out.push_back('|');
            append_escaped(out, alternatives[i]);
        }
        out.push_back(']');
    }
    return out;
}

} // namespace vargen
