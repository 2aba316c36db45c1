#include "vsync/version/pattern.hpp"

#include <cstring>

namespace vsync::version {
namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool suffix_matches(const std::string& text, std::size_t position, const std::string& suffix) {
    if (position + suffix.size() > text.size()) {
        return false;
    }
    return text.compare(position, suffix.size(), suffix) == 0;
}

FileOccurrence make_occurrence(const VersionMatch& match,
                               const std::string& file,
                               const std::string& revision) {
    FileOccurrence occurrence;
    occurrence.file = file;
    occurrence.revision = revision;
    occurrence.raw_match = match.raw;
    occurrence.parsed = match.spec;
    occurrence.offset = match.offset;
    occurrence.length = match.length;
    return occurrence;
}

} // namespace

PatternResolver::PatternResolver(VersionParser default_parser)
    : default_parser_(std::move(default_parser)) {}

std::string PatternResolver::substitute(const std::string& text, const config::ConfigEntry& entry) {
    std::string result = text;
    for (const auto& [key, value] : entry.substitutions) {
        if (key == "current_version") {
            continue;
        }
        replace_all(result, "{" + key + "}", value);
    }
    return result;
}

Result<SearchSpec> PatternResolver::build(const config::ConfigEntry& entry,
                                          const VersionSpec& version) const {
    SearchSpec spec;
    spec.parser = default_parser_;

    if (entry.pattern && !entry.pattern->empty()) {
        auto parser = VersionParser::create(*entry.pattern);
        if (parser.is_error()) {
            return Err<SearchSpec>(parser.error());
        }
        spec.parser = std::move(parser.value());
    }

    if (!entry.search || entry.search->empty()) {
        spec.kind = SearchSpec::Kind::Pattern;
        return Ok(spec);
    }

    spec.kind = SearchSpec::Kind::Literal;
    const std::string& tmpl = *entry.search;
    const auto slot = tmpl.find(kVersionPlaceholder);

    if (slot == std::string::npos) {
        spec.literal = substitute(tmpl, entry);
        spec.has_slot = false;
        return Ok(spec);
    }

    spec.has_slot = true;
    spec.prefix = substitute(tmpl.substr(0, slot), entry);
    spec.suffix = substitute(tmpl.substr(slot + std::strlen(kVersionPlaceholder)), entry);

    std::string version_text = version.to_string();
    // Later placeholders (rare) take the same literal value
    replace_all(spec.suffix, kVersionPlaceholder, version_text);
    spec.literal = spec.prefix + version_text + spec.suffix;
    return Ok(spec);
}

Result<FileOccurrence> PatternResolver::locate(const SearchSpec& spec,
                                               const std::string& text,
                                               const std::string& file,
                                               const std::string& revision) const {
    if (spec.kind == SearchSpec::Kind::Pattern) {
        auto found = spec.parser.find(text);
        if (found.is_error()) {
            return Err<FileOccurrence>(Error::parse(file + "@" + revision + ": " + found.error().message));
        }
        return Ok(make_occurrence(found.value(), file, revision));
    }

    // Exact template first: the file already carries the declared version
    const auto exact = text.find(spec.literal);
    if (exact != std::string::npos) {
        if (spec.has_slot) {
            if (auto match = spec.parser.match_at(text, exact + spec.prefix.size())) {
                return Ok(make_occurrence(*match, file, revision));
            }
        } else {
            auto inner = spec.parser.find(spec.literal);
            if (inner.is_ok()) {
                auto match = inner.value();
                match.offset += exact;
                return Ok(make_occurrence(match, file, revision));
            }
        }
    }

    // Otherwise look for any version sitting between the template's literal parts
    if (spec.has_slot) {
        if (!spec.prefix.empty()) {
            for (auto pos = text.find(spec.prefix); pos != std::string::npos;
                 pos = text.find(spec.prefix, pos + 1)) {
                auto match = spec.parser.match_at(text, pos + spec.prefix.size());
                if (match && suffix_matches(text, match->offset + match->length, spec.suffix)) {
                    return Ok(make_occurrence(*match, file, revision));
                }
            }
        } else {
            std::size_t from = 0;
            while (true) {
                auto match = spec.parser.find(text, from);
                if (match.is_error()) {
                    break;
                }
                const auto& found = match.value();
                if (suffix_matches(text, found.offset + found.length, spec.suffix)) {
                    return Ok(make_occurrence(found, file, revision));
                }
                from = found.offset + 1;
            }
        }
    }

    return Err<FileOccurrence>(Error::parse(file + "@" + revision + ": search text '" + spec.literal + "' not found"));
}

} // namespace vsync::version
