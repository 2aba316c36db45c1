#pragma once

#include "vsync/config/types.hpp"
#include "vsync/core/result.hpp"
#include "vsync/version/parser.hpp"
#include "vsync/version/version.hpp"

#include <cstddef>
#include <string>

namespace vsync::version {

inline constexpr const char* kVersionPlaceholder = "{current_version}";

/**
 * @brief How to find the version of one entry inside a file
 *
 * Literal specs come from bumpversion search templates and are matched as
 * plain text. The template is kept split around its {current_version} slot
 * so the same spec also finds an older version sitting in that slot.
 */
struct SearchSpec {
    enum class Kind {
        Literal,
        Pattern
    };

    Kind kind = Kind::Pattern;
    std::string literal;       ///< Template with the declared version substituted
    std::string prefix;        ///< Literal text before the version slot
    std::string suffix;        ///< Literal text after the version slot
    bool has_slot = false;     ///< Template contained {current_version}
    VersionParser parser;      ///< Pattern to search (Pattern) or to read the slot (Literal)
};

/**
 * @brief A located version inside one file at one revision
 */
struct FileOccurrence {
    std::string file;
    std::string revision;
    std::string raw_match;
    VersionSpec parsed;
    std::size_t offset = 0;
    std::size_t length = 0;
};

/**
 * @brief Builds SearchSpec values from config entries and runs the lookup
 */
class PatternResolver {
public:
    explicit PatternResolver(VersionParser default_parser = VersionParser());

    /**
     * @brief Build the search for entry, substituting version into its template
     * @return Config error if the entry's regex override does not compile
     */
    [[nodiscard]] Result<SearchSpec> build(const config::ConfigEntry& entry,
                                           const VersionSpec& version) const;

    /**
     * @brief First-match lookup of spec inside text
     * @return Parse error when nothing matches
     */
    [[nodiscard]] Result<FileOccurrence> locate(const SearchSpec& spec,
                                                const std::string& text,
                                                const std::string& file,
                                                const std::string& revision) const;

    [[nodiscard]] const VersionParser& default_parser() const noexcept { return default_parser_; }

private:
    static std::string substitute(const std::string& text, const config::ConfigEntry& entry);

    VersionParser default_parser_;
};

} // namespace vsync::version
