#include "vsync/sync/conflict.hpp"
#include "vsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace vsync::sync {
namespace fs = std::filesystem;
namespace {

enum class ScanState {
    Outside,
    InOurs,
    InBase,
    InTheirs
};

enum class Marker {
    None,
    Start,      // <<<<<<<
    Base,       // |||||||
    Separator,  // =======
    End         // >>>>>>>
};

constexpr std::size_t kMarkerWidth = 7;

std::string without_terminator(const std::string& line) {
    std::string body = line;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }
    return body;
}

bool has_marker(const std::string& body, char c) {
    if (body.size() < kMarkerWidth) {
        return false;
    }
    for (std::size_t i = 0; i < kMarkerWidth; ++i) {
        if (body[i] != c) {
            return false;
        }
    }
    return body.size() == kMarkerWidth || body[kMarkerWidth] == ' ';
}

Marker classify(const std::string& line) {
    const auto body = without_terminator(line);
    if (has_marker(body, '<')) return Marker::Start;
    if (has_marker(body, '|')) return Marker::Base;
    if (has_marker(body, '>')) return Marker::End;
    if (body.size() == kMarkerWidth && has_marker(body, '=')) return Marker::Separator;
    return Marker::None;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

std::string replacement_text(const BlockResolution& resolution) {
    using Outcome = BlockResolution::Outcome;
    switch (resolution.outcome) {
        case Outcome::KeptOurs: return resolution.block.ours;
        case Outcome::KeptTheirs: return resolution.block.theirs;
        case Outcome::KeptBoth: return resolution.block.ours + resolution.block.theirs;
        case Outcome::KeptNeither: return {};
        case Outcome::Manual: return resolution.block.text;
    }
    return resolution.block.text;
}

Result<void> write_atomically(const fs::path& path, const std::string& content) {
    fs::path temp = path;
    temp += ".vsync-tmp";

    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(Error::io("Cannot create " + temp.string()));
        }
        output << content;
        output.flush();
        if (!output) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(Error::io("Failed writing " + temp.string()));
        }
    }

    std::error_code ec;
    fs::permissions(temp, fs::status(path, ec).permissions(), ec);

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err<void>(Error::io("Cannot replace " + path.string() + ": " + ec.message()));
    }
    return Ok();
}

} // namespace

const char* merge_strategy_name(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Higher: return "higher";
        case MergeStrategy::Lower: return "lower";
        case MergeStrategy::Ours: return "ours";
        case MergeStrategy::Theirs: return "theirs";
        case MergeStrategy::Both: return "both";
        case MergeStrategy::Neither: return "neither";
    }
    return "unknown";
}

Result<MergeStrategy> parse_merge_strategy(const std::string& name) {
    if (name == "higher") return Ok(MergeStrategy::Higher);
    if (name == "lower") return Ok(MergeStrategy::Lower);
    if (name == "ours" || name == "current") return Ok(MergeStrategy::Ours);
    if (name == "theirs" || name == "incoming") return Ok(MergeStrategy::Theirs);
    if (name == "both") return Ok(MergeStrategy::Both);
    if (name == "neither") return Ok(MergeStrategy::Neither);
    return Err<MergeStrategy>(Error::config("Unknown merge strategy: " + name));
}

const char* outcome_name(BlockResolution::Outcome outcome) {
    using Outcome = BlockResolution::Outcome;
    switch (outcome) {
        case Outcome::KeptOurs: return "ours";
        case Outcome::KeptTheirs: return "theirs";
        case Outcome::KeptBoth: return "both";
        case Outcome::KeptNeither: return "neither";
        case Outcome::Manual: return "manual";
    }
    return "unknown";
}

std::size_t ConflictResolution::resolved_count() const {
    return static_cast<std::size_t>(std::count_if(blocks.begin(), blocks.end(), [](const BlockResolution& b) {
        return b.outcome != BlockResolution::Outcome::Manual;
    }));
}

std::size_t ConflictResolution::manual_count() const {
    return blocks.size() - resolved_count();
}

ConflictResolver::ConflictResolver(version::VersionParser parser,
                                   MergeStrategy strategy,
                                   events::EventBus* bus)
    : parser_(std::move(parser)), strategy_(strategy), bus_(bus) {}

BlockResolution ConflictResolver::decide(ConflictBlock block) const {
    using Outcome = BlockResolution::Outcome;

    BlockResolution resolution;
    if (auto ours = parser_.find(block.ours); ours.is_ok()) {
        resolution.ours_version = ours.value().spec;
    }
    if (auto theirs = parser_.find(block.theirs); theirs.is_ok()) {
        resolution.theirs_version = theirs.value().spec;
    }
    resolution.block = std::move(block);

    const bool has_ours = resolution.ours_version.has_value();
    const bool has_theirs = resolution.theirs_version.has_value();
    if (!has_ours && !has_theirs) {
        resolution.outcome = Outcome::Manual;
        return resolution;
    }

    switch (strategy_) {
        case MergeStrategy::Higher:
        case MergeStrategy::Lower:
            if (has_ours && has_theirs) {
                const int order = resolution.ours_version->compare(*resolution.theirs_version);
                const bool keep_ours = strategy_ == MergeStrategy::Higher ? order >= 0 : order <= 0;
                resolution.outcome = keep_ours ? Outcome::KeptOurs : Outcome::KeptTheirs;
            } else {
                resolution.outcome = has_ours ? Outcome::KeptOurs : Outcome::KeptTheirs;
            }
            break;
        case MergeStrategy::Ours:
            resolution.outcome = Outcome::KeptOurs;
            break;
        case MergeStrategy::Theirs:
            resolution.outcome = Outcome::KeptTheirs;
            break;
        case MergeStrategy::Both:
            resolution.outcome = Outcome::KeptBoth;
            break;
        case MergeStrategy::Neither:
            resolution.outcome = Outcome::KeptNeither;
            break;
    }
    return resolution;
}

ConflictResolution ConflictResolver::resolve(const std::string& conflict_text) const {
    ConflictResolution result;
    ScanState state = ScanState::Outside;
    ConflictBlock current;

    auto open_block = [&](const std::string& line, std::size_t line_no) {
        current = ConflictBlock{};
        current.start_line = line_no;
        current.text = line;
        state = ScanState::InOurs;
    };

    // Aborted blocks go back into the output exactly as they were
    auto abort_block = [&](std::size_t line_no, std::string reason) {
        result.malformed.push_back({line_no, std::move(reason)});
        result.text += current.text;
        state = ScanState::Outside;
    };

    const auto lines = split_lines(conflict_text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        const std::size_t line_no = i + 1;
        const Marker marker = classify(line);

        switch (state) {
            case ScanState::Outside:
                if (marker == Marker::Start) {
                    open_block(line, line_no);
                } else {
                    if (marker != Marker::None) {
                        result.malformed.push_back({line_no, "conflict marker '" + without_terminator(line)
                                                                 + "' without a preceding '<<<<<<<'"});
                    }
                    result.text += line;
                }
                break;

            case ScanState::InOurs:
            case ScanState::InBase:
                if (marker == Marker::None) {
                    current.text += line;
                    (state == ScanState::InOurs ? current.ours : current.base) += line;
                } else if (marker == Marker::Separator) {
                    current.text += line;
                    state = ScanState::InTheirs;
                } else if (marker == Marker::Base && state == ScanState::InOurs) {
                    current.text += line;
                    state = ScanState::InBase;
                } else if (marker == Marker::Start) {
                    abort_block(current.start_line, "conflict opened at line " + std::to_string(current.start_line)
                                                        + " is interrupted by '<<<<<<<' at line " + std::to_string(line_no));
                    open_block(line, line_no);
                } else {
                    current.text += line;
                    abort_block(line_no, "'" + without_terminator(line) + "' before '=======' in conflict opened at line "
                                             + std::to_string(current.start_line));
                }
                break;

            case ScanState::InTheirs:
                if (marker == Marker::None) {
                    current.text += line;
                    current.theirs += line;
                } else if (marker == Marker::End) {
                    current.text += line;
                    current.end_line = line_no;
                    auto decided = decide(std::move(current));
                    result.text += replacement_text(decided);
                    result.blocks.push_back(std::move(decided));
                    state = ScanState::Outside;
                } else if (marker == Marker::Start) {
                    abort_block(current.start_line, "conflict opened at line " + std::to_string(current.start_line)
                                                        + " is interrupted by '<<<<<<<' at line " + std::to_string(line_no));
                    open_block(line, line_no);
                } else {
                    current.text += line;
                    abort_block(line_no, "unexpected '" + without_terminator(line) + "' after '=======' in conflict opened at line "
                                             + std::to_string(current.start_line));
                }
                break;
        }
    }

    if (state != ScanState::Outside) {
        abort_block(current.start_line, "conflict opened at line " + std::to_string(current.start_line)
                                            + " is never closed");
    }

    return result;
}

Result<ConflictResolution> ConflictResolver::resolve_file(const fs::path& path,
                                                          const std::string& display_name) const {
    const std::string name = display_name.empty() ? path.generic_string() : display_name;

    if (!fs::is_regular_file(path)) {
        return Err<ConflictResolution>(Error::not_found(name + " does not exist"));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<ConflictResolution>(Error::io("Cannot open " + name));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    input.close();
    const std::string original = buffer.str();

    auto resolution = resolve(original);
    publish(resolution, name);

    if (!resolution.malformed.empty()) {
        std::ostringstream message;
        message << name << ":";
        for (const auto& bad : resolution.malformed) {
            message << " [line " << bad.line << "] " << bad.reason << ";";
        }
        return Err<ConflictResolution>(Error::malformed_conflict(message.str()));
    }

    if (resolution.text != original) {
        auto written = write_atomically(path, resolution.text);
        if (written.is_error()) {
            return Err<ConflictResolution>(written.error());
        }
        spdlog::debug("Rewrote {} ({} block(s) resolved)", name, resolution.resolved_count());
    }

    return Ok(resolution);
}

void ConflictResolver::publish(const ConflictResolution& resolution, const std::string& file) const {
    if (bus_ == nullptr) {
        return;
    }

    for (const auto& block : resolution.blocks) {
        if (block.outcome == BlockResolution::Outcome::Manual) {
            bus_->emit(events::ConflictManualEvent{file, block.block.start_line});
            continue;
        }

        std::string version;
        if (block.outcome == BlockResolution::Outcome::KeptOurs && block.ours_version) {
            version = block.ours_version->to_string();
        } else if (block.outcome == BlockResolution::Outcome::KeptTheirs && block.theirs_version) {
            version = block.theirs_version->to_string();
        }
        bus_->emit(events::ConflictResolvedEvent{file, block.block.start_line,
                                                 merge_strategy_name(strategy_),
                                                 outcome_name(block.outcome), version});
    }

    for (const auto& bad : resolution.malformed) {
        bus_->emit(events::MalformedConflictEvent{file, bad.line, bad.reason});
    }
}

} // namespace vsync::sync
