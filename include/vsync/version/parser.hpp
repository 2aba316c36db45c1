#pragma once

#include "vsync/core/result.hpp"
#include "vsync/version/version.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>

namespace vsync::version {

/// Three dot-separated digit runs. With this pattern an optional "-pre" /
/// "+build" suffix is scanned by hand after the match, since std::regex
/// recurses once per repeated character and overflows on long labels.
inline constexpr const char* kDefaultVersionPattern = R"([0-9]+\.[0-9]+\.[0-9]+)";

/**
 * @brief One version occurrence located inside a larger text
 */
struct VersionMatch {
    std::string raw;          ///< Text exactly as found
    std::size_t offset = 0;   ///< Byte offset of raw inside the searched text
    std::size_t length = 0;
    VersionSpec spec;
};

/**
 * @brief Turns captured text into VersionSpec values using a configurable regex
 *
 * The regex decides WHAT counts as a version; the parser then splits the
 * matched text into its digit runs and suffix. A custom regex may include
 * surrounding context ("version: [0-9.]+"): capture group 1 is used when it
 * holds a version, otherwise the version embedded in the match. Stateless
 * after construction.
 */
class VersionParser {
public:
    /// Uses kDefaultVersionPattern
    VersionParser();

    /**
     * @brief Build a parser for a custom pattern
     * @return Config error when the pattern is not a valid ECMAScript regex
     */
    static Result<VersionParser> create(const std::string& pattern);

    /**
     * @brief Parse a whole (trimmed) string as one version
     * @return Parse error when the pattern does not match the entire input
     */
    [[nodiscard]] Result<VersionSpec> parse(const std::string& raw) const;

    /**
     * @brief Locate the first version occurrence at or after start
     */
    [[nodiscard]] Result<VersionMatch> find(const std::string& text, std::size_t start = 0) const;

    /**
     * @brief Match a version starting exactly at position
     */
    [[nodiscard]] std::optional<VersionMatch> match_at(const std::string& text, std::size_t position) const;

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    VersionParser(std::string pattern, std::regex regex);

    std::optional<VersionMatch> extract(const std::smatch& match,
                                        const std::string& text,
                                        std::size_t base) const;

    std::string pattern_;
    std::regex regex_;
    bool scan_label_ = true;
};

/**
 * @brief Split matched text ("v1.02.3-rc.1") into a VersionSpec
 *
 * Used by VersionParser once its regex has accepted the text.
 */
Result<VersionSpec> decompose(const std::string& matched);

} // namespace vsync::version
