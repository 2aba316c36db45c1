#include "vsync/version/parser.hpp"

#include <cctype>
#include <limits>
#include <utility>

namespace vsync::version {
namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_v(char c) {
    return c == 'v' || c == 'V';
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// "1.2.3." shows up when a permissive pattern such as ([0-9]+\.?){3}
// swallows a sentence-ending dot
std::size_t trailing_dot_count(const std::string& text) {
    std::size_t count = 0;
    while (count < text.size() && text[text.size() - 1 - count] == '.') {
        ++count;
    }
    return count;
}

void drop_trailing_dots(std::string& text) {
    text.resize(text.size() - trailing_dot_count(text));
}

// Length of a "-pre" / "+build" suffix starting at position, 0 when absent
std::size_t label_length(const std::string& text, std::size_t position) {
    const std::size_t n = text.size();
    if (position + 1 >= n || (text[position] != '-' && text[position] != '+') || !is_alnum(text[position + 1])) {
        return 0;
    }
    std::size_t i = position + 2;
    while (i < n && (is_alnum(text[i]) || text[i] == '.' || text[i] == '+' || text[i] == '-')) {
        ++i;
    }
    return i - position;
}

// End of the dotted digit runs starting at position; sets dotted when more
// than one component was consumed
std::size_t numeric_end(const std::string& text, std::size_t position, bool& dotted) {
    const std::size_t n = text.size();
    std::size_t i = position;
    dotted = false;
    while (true) {
        while (i < n && is_digit(text[i])) {
            ++i;
        }
        if (i + 1 < n && text[i] == '.' && is_digit(text[i + 1])) {
            ++i;
            dotted = true;
            continue;
        }
        return i;
    }
}

// True when text is exactly [v]digits(.digits)*[label]
bool is_bare_version(const std::string& text) {
    std::size_t i = 0;
    if (text.size() > 1 && is_v(text[0]) && is_digit(text[1])) {
        i = 1;
    }
    if (i >= text.size() || !is_digit(text[i])) {
        return false;
    }
    bool dotted = false;
    i = numeric_end(text, i, dotted);
    return i + label_length(text, i) == text.size();
}

// First version run inside a larger match ("version: 1.2.3"). Dotted runs
// win over lone digit runs such as the 3 in "python3".
std::optional<std::pair<std::size_t, std::size_t>> embedded_version(const std::string& text) {
    std::optional<std::pair<std::size_t, std::size_t>> lone;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_digit(text[i]) || (i > 0 && is_digit(text[i - 1]))) {
            continue;
        }
        bool dotted = false;
        std::size_t end = numeric_end(text, i, dotted);
        end += label_length(text, end);

        std::size_t begin = i;
        if (begin > 0 && is_v(text[begin - 1]) && (begin == 1 || !is_alnum(text[begin - 2]))) {
            --begin;
        }
        if (dotted) {
            return std::make_pair(begin, end - begin);
        }
        if (!lone) {
            lone = std::make_pair(begin, end - begin);
        }
        i = end;
    }
    return lone;
}

std::optional<VersionMatch> make_match(std::string raw, std::size_t offset) {
    drop_trailing_dots(raw);
    if (raw.empty()) {
        return std::nullopt;
    }
    auto spec = decompose(raw);
    if (spec.is_error()) {
        return std::nullopt;
    }
    VersionMatch found;
    found.offset = offset;
    found.length = raw.size();
    found.raw = std::move(raw);
    found.spec = std::move(spec.value());
    return found;
}

} // namespace

VersionParser::VersionParser()
    : pattern_(kDefaultVersionPattern), regex_(kDefaultVersionPattern) {}

VersionParser::VersionParser(std::string pattern, std::regex regex)
    : pattern_(std::move(pattern)), regex_(std::move(regex)), scan_label_(pattern_ == kDefaultVersionPattern) {}

Result<VersionParser> VersionParser::create(const std::string& pattern) {
    if (pattern.empty()) {
        return Ok(VersionParser());
    }
    try {
        std::regex regex(pattern);
        return Ok(VersionParser(pattern, std::move(regex)));
    } catch (const std::regex_error& e) {
        return Err<VersionParser>(Error::config("Invalid version pattern '" + pattern + "': " + e.what()));
    }
}

Result<VersionSpec> VersionParser::parse(const std::string& raw) const {
    const std::string text = trim(raw);
    if (text.empty()) {
        return Err<VersionSpec>(Error::parse("Malformed version: empty input"));
    }

    // An optional leading 'v' is not part of the pattern's business
    std::string body = text;
    if (is_v(body[0]) && body.size() > 1 && is_digit(body[1])) {
        body.erase(0, 1);
    }

    bool accepted = false;
    if (scan_label_) {
        const auto split = body.find_first_of("-+");
        const std::string core = body.substr(0, split);
        accepted = std::regex_match(core, regex_) &&
                   (split == std::string::npos || split + label_length(body, split) == body.size());
    } else {
        accepted = std::regex_match(body, regex_);
    }

    if (!accepted) {
        return Err<VersionSpec>(Error::parse("Malformed version '" + text + "' (pattern " + pattern_ + ")"));
    }
    return decompose(text);
}

std::optional<VersionMatch> VersionParser::extract(const std::smatch& match,
                                                   const std::string& text,
                                                   std::size_t base) const {
    const std::size_t offset = base + static_cast<std::size_t>(match.position(0));
    std::string raw = match.str(0);

    if (scan_label_) {
        raw += text.substr(offset + raw.size(), label_length(text, offset + raw.size()));
    }

    std::string whole = raw;
    drop_trailing_dots(whole);
    if (is_bare_version(whole)) {
        return make_match(std::move(whole), offset);
    }

    if (regex_.mark_count() > 0 && match[1].matched) {
        std::string group = match.str(1);
        drop_trailing_dots(group);
        if (is_bare_version(group)) {
            return make_match(std::move(group), base + static_cast<std::size_t>(match.position(1)));
        }
    }

    if (const auto inner = embedded_version(raw)) {
        return make_match(raw.substr(inner->first, inner->second), offset + inner->first);
    }
    return std::nullopt;
}

Result<VersionMatch> VersionParser::find(const std::string& text, std::size_t start) const {
    if (start > text.size()) {
        return Err<VersionMatch>(Error::parse("No version matching " + pattern_ + " found"));
    }

    const auto begin = text.begin() + static_cast<std::string::difference_type>(start);
    const auto flags = start > 0 ? std::regex_constants::match_prev_avail
                                 : std::regex_constants::match_default;
    auto it = std::sregex_iterator(begin, text.end(), regex_, flags);
    const auto end = std::sregex_iterator();

    for (; it != end; ++it) {
        if (auto found = extract(*it, text, start)) {
            return Ok(std::move(*found));
        }
    }

    return Err<VersionMatch>(Error::parse("No version matching " + pattern_ + " found"));
}

std::optional<VersionMatch> VersionParser::match_at(const std::string& text, std::size_t position) const {
    if (position >= text.size()) {
        return std::nullopt;
    }

    std::smatch match;
    const auto begin = text.begin() + static_cast<std::string::difference_type>(position);
    auto flags = std::regex_constants::match_continuous;
    if (position > 0) {
        flags |= std::regex_constants::match_prev_avail;
    }
    if (!std::regex_search(begin, text.end(), match, regex_, flags)) {
        return std::nullopt;
    }

    auto found = extract(match, text, position);
    if (!found || found->offset != position) {
        return std::nullopt;
    }
    return found;
}

Result<VersionSpec> decompose(const std::string& matched) {
    const std::size_t n = matched.size();
    std::size_t i = 0;

    std::string prefix;
    if (n > 1 && is_v(matched[0]) && is_digit(matched[1])) {
        prefix = matched.substr(0, 1);
        i = 1;
    }

    if (i >= n || !is_digit(matched[i])) {
        return Err<VersionSpec>(Error::parse("Malformed version '" + matched + "': no numeric component"));
    }

    std::vector<std::string> text;
    std::vector<std::uint64_t> numbers;
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();

    while (true) {
        const std::size_t start = i;
        std::uint64_t value = 0;
        while (i < n && is_digit(matched[i])) {
            const auto digit = static_cast<std::uint64_t>(matched[i] - '0');
            if (value > (kMax - digit) / 10) {
                return Err<VersionSpec>(Error::parse("Version component overflows in '" + matched + "'"));
            }
            value = value * 10 + digit;
            ++i;
        }
        text.push_back(matched.substr(start, i - start));
        numbers.push_back(value);

        if (i + 1 < n && matched[i] == '.' && is_digit(matched[i + 1])) {
            ++i;
            continue;
        }
        break;
    }

    std::string label = matched.substr(i);
    if (label.find_first_not_of('.') == std::string::npos) {
        label.clear();
    }

    return Ok(VersionSpec(std::move(text), std::move(numbers), std::move(label), std::move(prefix)));
}

} // namespace vsync::version
