// Template parsing into literal and choice-group segments.
//
// Grammar (single pass, no nesting):
//   - `[` opens a choice group, `]` closes it, `|` separates alternatives.
//   - Inside a group `[` is ordinary text of the current alternative.
//   - Outside a group `|` is ordinary text; a stray `]` is an error.
//   - Backslash escapes `[`, `]`, `|` and `\`. A backslash before any other
//     character, or at the end of the text, stays a literal backslash.
//   - `[]` is a group with one empty alternative, `[|]` one with two.
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vargen {

struct Literal {
    std::string text;

    bool operator==(const Literal &) const = default;
};

// Ordered alternatives of one bracket group. Never empty once parsed.
struct ChoiceGroup {
    std::vector<std::string> alternatives;

    bool operator==(const ChoiceGroup &) const = default;
};

using Segment = std::variant<Literal, ChoiceGroup>;

// Parsed template; immutable after parsing and shared read-only by workers.
struct Template {
    std::vector<Segment> segments;

    std::size_t group_count() const;
};

// Throws vargen::error(MalformedTemplate) with the offending 0-based position.
Template parse_template(std::string_view text);

// Check a template built by hand. Throws vargen::error(EmptyChoiceGroup) for
// a group without alternatives; parse_template() never produces one.
void validate_template(const Template &tpl);

// Escape `text` so that parse_template() yields exactly one literal equal to it.
std::string escape_template_text(std::string_view text);

// Write segments back in template syntax. parse_template() of the result
// reproduces `tpl` up to merging of adjacent literals.
std::string render_template_text(const Template &tpl);

} // namespace vargen
