// Mixed-radix index space over a parsed template.
#pragma once

#include "vargen/template.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vargen {

// Upper bound on combinations for a single template unless configured otherwise.
inline constexpr std::uint64_t kDefaultMaxCombinations = std::uint64_t{1} << 40;

// Maps a combination index in [0, total) to its rendered string without
// enumerating the space. Indices enumerate combinations in lexicographic
// order over the groups: the last group is the least significant digit and
// cycles fastest, like an odometer.
//
// Instances are immutable and safe to share across threads.
class CombinationSpace {
  public:
    // Throws vargen::error: EmptyChoiceGroup for a group without alternatives,
    // CombinationSpaceTooLarge when the product overflows or exceeds
    // `max_combinations`, InvalidConfiguration when `max_combinations` is 0.
    explicit CombinationSpace(std::shared_ptr<const Template> tpl, std::uint64_t max_combinations = kDefaultMaxCombinations);

    const Template                 &get_template() const { return *template_; }
    const std::vector<std::size_t> &shape() const { return shape_; }
    std::uint64_t                   total() const { return total_; }

    // One alternative index per choice group, in declaration order.
    // Throws std::out_of_range for index >= total().
    std::vector<std::size_t> decode(std::uint64_t index) const;

    std::string render(std::uint64_t index) const;

    // Appends the rendering of `index` to `out`.
    void render_into(std::uint64_t index, std::string &out) const;

  private:
    std::shared_ptr<const Template> template_;
    std::vector<std::size_t>        shape_;
    std::vector<std::uint64_t>      strides_;
    std::uint64_t                   total_ = 1;
};

// Collapse runs of ' ' to one and strip leading/trailing spaces in place.
void squeeze_spaces(std::string &text);

} // namespace vargen
