#include "vsync/version/version.hpp"

#include <algorithm>
#include <sstream>

namespace vsync::version {

VersionSpec::VersionSpec(std::vector<std::string> component_text,
                         std::vector<std::uint64_t> components,
                         std::string label,
                         std::string prefix)
    : component_text_(std::move(component_text)),
      components_(std::move(components)),
      label_(std::move(label)),
      prefix_(std::move(prefix)) {}

VersionSpec VersionSpec::from_numbers(std::vector<std::uint64_t> components, std::string label) {
    std::vector<std::string> text;
    text.reserve(components.size());
    for (auto value : components) {
        text.push_back(std::to_string(value));
    }
    return VersionSpec(std::move(text), std::move(components), std::move(label));
}

std::uint64_t VersionSpec::component(std::size_t index) const noexcept {
    return index < components_.size() ? components_[index] : 0;
}

int VersionSpec::compare(const VersionSpec& other) const noexcept {
    const auto width = std::max(components_.size(), other.components_.size());
    for (std::size_t i = 0; i < width; ++i) {
        const auto lhs = component(i);
        const auto rhs = other.component(i);
        if (lhs != rhs) {
            return lhs < rhs ? -1 : 1;
        }
    }

    // A pre-release/build label sorts before the bare numeric tuple
    if (has_label() != other.has_label()) {
        return has_label() ? -1 : 1;
    }

    const int label_order = label_.compare(other.label_);
    if (label_order != 0) {
        return label_order < 0 ? -1 : 1;
    }
    return 0;
}

std::string VersionSpec::to_string() const {
    std::ostringstream oss;
    oss << prefix_;
    for (std::size_t i = 0; i < component_text_.size(); ++i) {
        if (i > 0) {
            oss << '.';
        }
        oss << component_text_[i];
    }
    oss << label_;
    return oss.str();
}

std::string format(const VersionSpec& version) {
    return version.to_string();
}

} // namespace vsync::version
