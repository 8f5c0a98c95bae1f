#include "vargen/combination_space.h"

#include "vargen/error.h"

#include <fmt/format.h>

#include <limits>
#include <stdexcept>
#include <utility>

namespace vargen {

CombinationSpace::CombinationSpace(std::shared_ptr<const Template> tpl, std::uint64_t max_combinations)
    : template_(std::move(tpl)) {
    if (!template_) {
        throw std::invalid_argument("CombinationSpace requires a template");
    }
    if (max_combinations == 0) {
        throw error(ErrorKind::InvalidConfiguration, "max_combinations must be positive");
    }
    validate_template(*template_);

    constexpr std::uint64_t maxv = std::numeric_limits<std::uint64_t>::max();
    for (const auto &segment : template_->segments) {
        const auto *group = std::get_if<ChoiceGroup>(&segment);
        if (group == nullptr)
            continue;
        const auto n = static_cast<std::uint64_t>(group->alternatives.size());
        shape_.push_back(group->alternatives.size());
        if (total_ > maxv / n) {
            throw error(ErrorKind::CombinationSpaceTooLarge,
                        fmt::format("combination count overflows 64 bits after {} choice groups", shape_.size()));
        }
        total_ *= n;
        if (total_ > max_combinations) {
            throw error(ErrorKind::CombinationSpaceTooLarge,
                        fmt::format("template expands to more than {} combinations (limit reached after {} choice groups)",
                                    max_combinations, shape_.size()));
        }
    }

    // Last group is the least significant digit.
    strides_.assign(shape_.size(), 1);
    for (std::size_t j = shape_.size(); j > 1; --j) {
        strides_[j - 2] = strides_[j - 1] * static_cast<std::uint64_t>(shape_[j - 1]);
    }
}

std::vector<std::size_t> CombinationSpace::decode(std::uint64_t index) const {
    if (index >= total_) {
        throw std::out_of_range(fmt::format("combination index {} is outside [0, {})", index, total_));
    }
    std::vector<std::size_t> choices(shape_.size());
    for (std::size_t j = shape_.size(); j-- > 0;) {
        const auto n = static_cast<std::uint64_t>(shape_[j]);
        choices[j]   = static_cast<std::size_t>(index % n);
        index /= n;
    }
    return choices;
}

std::string CombinationSpace::render(std::uint64_t index) const {
    std::string out;
    render_into(index, out);
    return out;
}

void CombinationSpace::render_into(std::uint64_t index, std::string &out) const {
    if (index >= total_) {
        throw std::out_of_range(fmt::format("combination index {} is outside [0, {})", index, total_));
    }
    std::size_t group = 0;
    for (const auto &segment : template_->segments) {
        if (const auto *lit = std::get_if<Literal>(&segment)) {
            out += lit->text;
            continue;
        }
        const auto &alternatives = std::get<ChoiceGroup>(segment).alternatives;
        const auto  digit        = (index / strides_[group]) % static_cast<std::uint64_t>(shape_[group]);
        out += alternatives[static_cast<std::size_t>(digit)];
        ++group;
    }
}

void squeeze_spaces(std::string &text) {
    std::size_t write      = 0;
    bool        prev_space = true; // drops leading spaces
    for (const char ch : text) {
        if (ch == ' ') {
            if (prev_space)
                continue;
            prev_space = true;
        } else {
            prev_space = false;
        }
        text[write++] = ch;
    }
    if (write > 0 && text[write - 1] == ' ')
        --write;
    text.resize(write);
}

} // namespace vargen
