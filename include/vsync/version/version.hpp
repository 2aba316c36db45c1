#pragma once

/**
 * @file version.hpp
 * @brief Structured, ordered version values
 *
 * WHY THIS FILE EXISTS:
 * Version strings found in files ("1.2.3", "v2.0.0-rc.1", "1.02.7") must be
 * compared, not just matched. VersionSpec is the comparable form produced by
 * VersionParser (version/parser.hpp).
 *
 * ORDERING:
 * 1. Numeric components compared left to right (missing trailing parts are 0)
 * 2. A labelled version sorts BEFORE the same numbers without a label
 * 3. Two labels are compared lexicographically
 *
 * EXAMPLE:
 * 1.2.3-rc.1 < 1.2.3 < 1.2.4 < 1.10.0
 */

#include <cstdint>
#include <string>
#include <vector>

namespace vsync::version {

class VersionSpec {
public:
    VersionSpec() = default;

    /**
     * @brief Build from already-split parts
     *
     * @param component_text Digit runs exactly as written (leading zeros kept)
     * @param components     Numeric value of each digit run
     * @param label          Suffix verbatim including its '-' or '+' lead
     * @param prefix         Optional leading 'v' / 'V'
     */
    VersionSpec(std::vector<std::string> component_text,
                std::vector<std::uint64_t> components,
                std::string label = {},
                std::string prefix = {});

    /// Convenience for tests and defaults: 1.2.3 style numbers, no label
    static VersionSpec from_numbers(std::vector<std::uint64_t> components,
                                    std::string label = {});

    [[nodiscard]] const std::vector<std::uint64_t>& components() const noexcept { return components_; }
    [[nodiscard]] const std::vector<std::string>& component_text() const noexcept { return component_text_; }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

    [[nodiscard]] bool has_label() const noexcept { return !label_.empty(); }
    [[nodiscard]] bool empty() const noexcept { return components_.empty(); }

    [[nodiscard]] std::uint64_t component(std::size_t index) const noexcept;

    /**
     * @brief Three-way comparison
     * @return negative, zero or positive like std::string::compare
     */
    [[nodiscard]] int compare(const VersionSpec& other) const noexcept;

    /// Textual form, identical to the text the value was parsed from
    [[nodiscard]] std::string to_string() const;

    bool operator==(const VersionSpec& other) const noexcept { return compare(other) == 0; }
    bool operator!=(const VersionSpec& other) const noexcept { return compare(other) != 0; }
    bool operator<(const VersionSpec& other) const noexcept { return compare(other) < 0; }
    bool operator>(const VersionSpec& other) const noexcept { return compare(other) > 0; }
    bool operator<=(const VersionSpec& other) const noexcept { return compare(other) <= 0; }
    bool operator>=(const VersionSpec& other) const noexcept { return compare(other) >= 0; }

private:
    std::vector<std::string> component_text_;
    std::vector<std::uint64_t> components_;
    std::string label_;
    std::string prefix_;
};

/// Same as VersionSpec::to_string(); parse(format(v)) == v
std::string format(const VersionSpec& version);

} // namespace vsync::version
