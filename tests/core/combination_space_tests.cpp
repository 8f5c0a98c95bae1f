#include "expect.hpp"

#include <vargen/combination_space.h>
#include <vargen/error.h>
#include <vargen/template.h>

#include <cstdint>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using vargen::CombinationSpace;
using vargen::ErrorKind;

namespace {

CombinationSpace space_of(std::string_view text, std::uint64_t max = vargen::kDefaultMaxCombinations) {
    return CombinationSpace(std::make_shared<const vargen::Template>(vargen::parse_template(text)), max);
}

std::vector<std::string> render_all(const CombinationSpace &space) {
    std::vector<std::string> out;
    for (std::uint64_t i = 0; i < space.total(); ++i) {
        out.push_back(space.render(i));
    }
    return out;
}

std::string repeated(std::string_view unit, std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i)
        out += unit;
    return out;
}

bool too_large(std::string_view text, std::uint64_t max = vargen::kDefaultMaxCombinations) {
    return vargen::test::throws_as<vargen::error>([&] { (void)space_of(text, max); },
                                                  [](const vargen::error &e) { return e.kind() == ErrorKind::CombinationSpaceTooLarge; });
}

} // namespace

int main() {
    vargen::test::Run t;

    {
        const auto space = space_of("[a|b]");
        t.expect(space.total() == 2, "[a|b] has two combinations");
        t.expect(render_all(space) == std::vector<std::string>{"a", "b"}, "[a|b] renders a then b");
    }

    {
        const auto space = space_of("x[1|2]y[3|4]");
        t.expect(space.shape() == std::vector<std::size_t>{2, 2}, "shape lists group sizes in order");
        t.expect(render_all(space) == std::vector<std::string>{"x1y3", "x1y4", "x2y3", "x2y4"}, "last group cycles fastest");
        t.expect(space.decode(1) == std::vector<std::size_t>{0, 1}, "index 1 advances the last group");
        t.expect(space.decode(2) == std::vector<std::size_t>{1, 0}, "index 2 carries into the first group");
    }

    {
        const auto space = space_of("plain text");
        t.expect(space.total() == 1 && space.shape().empty(), "no groups means one combination");
        t.expect(space.render(0) == "plain text", "no groups renders the template unchanged");
        t.expect(space.decode(0).empty(), "empty shape decodes to no choices");
        t.expect(space_of("").render(0).empty(), "empty template renders one empty string");
    }

    // Cardinality and bijection over a mixed-radix shape.
    {
        const auto space = space_of("[a|b|c]-[0|1]-[x|y|z|w]");
        t.expect(space.total() == 24, "3*2*4 combinations");
        std::set<std::vector<std::size_t>> tuples;
        std::set<std::string>              texts;
        for (std::uint64_t i = 0; i < space.total(); ++i) {
            const auto choices = space.decode(i);
            tuples.insert(choices);
            texts.insert(space.render(i));
            std::string manual = "abc"[choices[0]] + std::string("-") + "01"[choices[1]] + "-" + "xyzw"[choices[2]];
            t.expect(space.render(i) == manual, "render agrees with decode at " + std::to_string(i));
        }
        t.expect(tuples.size() == 24, "every index decodes to a distinct choice tuple");
        t.expect(texts.size() == 24, "every combination renders distinctly");
        t.expect(render_all(space).front() == "a-0-x" && render_all(space).back() == "c-1-w", "first and last in lexicographic order");
    }

    // Identical renderings still occupy distinct indices.
    {
        const auto space = space_of("[a|a][|]");
        t.expect(space.total() == 4, "duplicate alternatives still count");
        t.expect(render_all(space) == std::vector<std::string>{"a", "a", "a", "a"}, "no deduplication");
    }

    t.expect(vargen::test::throws_as<std::out_of_range>([] { (void)space_of("[a|b]").decode(2); }), "decode rejects index >= total");
    t.expect(vargen::test::throws_as<std::out_of_range>([] { (void)space_of("x").render(1); }), "render rejects index >= total");

    // Limits.
    t.expect(space_of(repeated("[0|1]", 40)).total() == (std::uint64_t{1} << 40), "2^40 fits under the default limit");
    t.expect(too_large(repeated("[0|1]", 41)), "2^41 exceeds the default limit");
    t.expect(too_large(repeated("[0|1|2|3]", 33), ~std::uint64_t{0}), "4^33 overflows 64 bits");
    t.expect(too_large("[a|b|c]", 2), "configured limit below the total");
    t.expect(space_of("[a|b|c]", 3).total() == 3, "configured limit equal to the total");
    t.expect(vargen::test::throws_as<vargen::error>([] { (void)space_of("x", 0); },
                                                    [](const vargen::error &e) { return e.kind() == ErrorKind::InvalidConfiguration; }),
             "zero limit is a configuration error");
    {
        const auto huge = space_of(repeated("[0|1]", 63), ~std::uint64_t{0});
        t.expect(huge.render(huge.total() - 1) == repeated("1", 63), "last index of a 2^63 space decodes without overflow");
        t.expect(huge.render(1) == repeated("0", 62) + "1", "index 1 of a 2^63 space");
    }

    {
        vargen::Template tpl;
        tpl.segments = {vargen::ChoiceGroup{}};
        t.expect(vargen::test::throws_as<vargen::error>(
                     [&] { CombinationSpace space(std::make_shared<const vargen::Template>(tpl)); },
                     [](const vargen::error &e) { return e.kind() == ErrorKind::EmptyChoiceGroup; }),
                 "a hand-built empty group is rejected");
    }

    {
        std::string text = "  Good   morning ,  John  ";
        vargen::squeeze_spaces(text);
        t.expect(text == "Good morning , John", "squeeze_spaces collapses and trims");
        std::string blank = "    ";
        vargen::squeeze_spaces(blank);
        t.expect(blank.empty(), "squeeze_spaces of only spaces is empty");
    }

    return t.finish();
}
