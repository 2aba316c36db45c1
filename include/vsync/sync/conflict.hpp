#pragma once

#include "vsync/core/result.hpp"
#include "vsync/events/event_bus.hpp"
#include "vsync/version/parser.hpp"
#include "vsync/version/version.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vsync::sync {

enum class MergeStrategy {
    Higher,   ///< Keep the side with the greater version (tie keeps ours)
    Lower,    ///< Keep the side with the smaller version (tie keeps ours)
    Ours,     ///< Always keep the current branch's side
    Theirs,   ///< Always keep the incoming side
    Both,     ///< Keep ours followed by theirs
    Neither   ///< Drop the whole block
};

const char* merge_strategy_name(MergeStrategy strategy);

/// Accepts higher, lower, ours/current, theirs/incoming, both, neither
Result<MergeStrategy> parse_merge_strategy(const std::string& name);

/**
 * @brief One <<<<<<< / ======= / >>>>>>> region, lines kept verbatim
 */
struct ConflictBlock {
    std::size_t start_line = 0;  ///< 1-based line of <<<<<<<
    std::size_t end_line = 0;    ///< 1-based line of >>>>>>>
    std::string ours;            ///< Lines between <<<<<<< and ||||||| / =======
    std::string base;            ///< diff3 base section, empty without |||||||
    std::string theirs;          ///< Lines between ======= and >>>>>>>
    std::string text;            ///< The whole block including markers
};

struct BlockResolution {
    enum class Outcome {
        KeptOurs,
        KeptTheirs,
        KeptBoth,
        KeptNeither,
        Manual      ///< No version on either side; block left in place
    };

    ConflictBlock block;
    Outcome outcome = Outcome::Manual;
    std::optional<version::VersionSpec> ours_version;
    std::optional<version::VersionSpec> theirs_version;
};

const char* outcome_name(BlockResolution::Outcome outcome);

struct MalformedBlock {
    std::size_t line = 0;   ///< 1-based line where the problem was noticed
    std::string reason;
};

struct ConflictResolution {
    std::string text;
    std::vector<BlockResolution> blocks;
    std::vector<MalformedBlock> malformed;

    [[nodiscard]] std::size_t resolved_count() const;
    [[nodiscard]] std::size_t manual_count() const;

    /// No markers remain and none were malformed
    [[nodiscard]] bool fully_resolved() const { return manual_count() == 0 && malformed.empty(); }
};

/**
 * @brief Resolves version conflicts in merge-conflicted text
 *
 * Scans once, left to right, with an explicit marker state machine. Each
 * block is decided on its own: the side carrying the winning version
 * replaces the whole block. Blocks without any version are left untouched
 * for manual resolution; malformed marker sequences are passed through and
 * reported.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(version::VersionParser parser = version::VersionParser(),
                              MergeStrategy strategy = MergeStrategy::Higher,
                              events::EventBus* bus = nullptr);

    [[nodiscard]] ConflictResolution resolve(const std::string& conflict_text) const;

    /**
     * @brief Resolve a working-tree file in place
     *
     * The new content replaces the old atomically (temp file + rename). A
     * file with malformed markers is not written and yields a
     * MalformedConflict error naming every malformed block.
     */
    Result<ConflictResolution> resolve_file(const std::filesystem::path& path,
                                            const std::string& display_name = {}) const;

    [[nodiscard]] MergeStrategy strategy() const noexcept { return strategy_; }

private:
    BlockResolution decide(ConflictBlock block) const;

    void publish(const ConflictResolution& resolution, const std::string& file) const;

    version::VersionParser parser_;
    MergeStrategy strategy_;
    events::EventBus* bus_;
};

} // namespace vsync::sync
