/**
 * @file config_reader.cpp
 * @brief Configuration reader implementation
 */

#include <planingsim/io/config_reader.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace pls {
namespace io {

namespace {

std::string strip(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

/// Drop a trailing " # ..." outside quotes
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return line.substr(0, i);
        }
    }
    return line;
}

int indent_of(const std::string& line) {
    int n = 0;
    for (char c : line) {
        if (c == ' ') n += 1;
        else if (c == '\t') n += 4;
        else break;
    }
    return n;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_integer_token(const std::string& s) {
    std::size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i == s.size()) return false;
    return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(i), s.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

/// Numeric scalar: Int when it is an integer in range, else Real; false if not a number
bool parse_number(const std::string& s, ConfigValue& out) {
    const std::string key = lower(s);
    if (key == "nan" || key == "-nan") {
        out = constants::nan<Real>;
        return true;
    }
    if (key == "inf" || key == "+inf" || key == "infinity") {
        out = constants::infinity<Real>;
        return true;
    }
    if (key == "-inf" || key == "-infinity") {
        out = -constants::infinity<Real>;
        return true;
    }

    if (is_integer_token(s)) {
        errno = 0;
        const long long v = std::strtoll(s.c_str(), nullptr, 10);
        if (errno == 0 && v >= std::numeric_limits<Int>::min() && v <= std::numeric_limits<Int>::max()) {
            out = static_cast<Int>(v);
            return true;
        }
    }

    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const Real v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE) {
        return false;
    }
    out = v;
    return true;
}

struct Frame {
    ConfigSection* section;
    int child_indent;  ///< Lines indented less than this close the frame
};

} // namespace

// ============================================================================
// ConfigSection
// ============================================================================

const ConfigValue* ConfigSection::find(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

void ConfigSection::type_mismatch(const std::string& key, const char* expected) const {
    throw InvalidArgumentError("Key '" + key + "' in section '" + name_ + "' is not " + expected);
}

std::string ConfigSection::get_string(const std::string& key, const std::string& default_val) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return default_val;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    type_mismatch(key, "a string");
}

Real ConfigSection::get_real(const std::string& key, Real default_val) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return default_val;
    if (const auto* r = std::get_if<Real>(v)) return *r;
    if (const auto* i = std::get_if<Int>(v)) return static_cast<Real>(*i);
    type_mismatch(key, "a number");
}

Int ConfigSection::get_int(const std::string& key, Int default_val) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return default_val;
    if (const auto* i = std::get_if<Int>(v)) return *i;
    type_mismatch(key, "an integer");
}

bool ConfigSection::get_bool(const std::string& key, bool default_val) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return default_val;
    if (const auto* b = std::get_if<bool>(v)) return *b;
    if (const auto* i = std::get_if<Int>(v)) return *i != 0;
    type_mismatch(key, "a boolean");
}

std::vector<Real> ConfigSection::get_real_array(const std::string& key) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return {};
    if (const auto* r = std::get_if<std::vector<Real>>(v)) return *r;
    if (const auto* i = std::get_if<std::vector<Int>>(v)) return std::vector<Real>(i->begin(), i->end());
    type_mismatch(key, "a numeric array");
}

std::vector<Int> ConfigSection::get_int_array(const std::string& key) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return {};
    if (const auto* i = std::get_if<std::vector<Int>>(v)) return *i;
    type_mismatch(key, "an integer array");
}

std::vector<std::string> ConfigSection::get_string_array(const std::string& key) const {
    const ConfigValue* v = find(key);
    if (v == nullptr) return {};
    if (const auto* s = std::get_if<std::vector<std::string>>(v)) return *s;
    type_mismatch(key, "a string array");
}

ConfigSection& ConfigSection::subsection(const std::string& name) {
    auto& slot = subsections_[name];
    if (!slot) {
        slot = std::make_shared<ConfigSection>(name);
    }
    return *slot;
}

const ConfigSection& ConfigSection::subsection(const std::string& name) const {
    auto it = subsections_.find(name);
    if (it == subsections_.end()) {
        throw InvalidArgumentError("No section '" + name + "' in '" + name_ + "'");
    }
    return *it->second;
}

std::vector<const ConfigSection*> ConfigSection::list_items() const {
    std::vector<const ConfigSection*> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        result.push_back(item.get());
    }
    return result;
}

ConfigSection& ConfigSection::append_item() {
    items_.push_back(std::make_shared<ConfigSection>(name_ + "[" + std::to_string(items_.size()) + "]"));
    return *items_.back();
}

// ============================================================================
// ConfigReader
// ============================================================================

ConfigSection ConfigReader::read(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOError(filename, "open");
    }
    PLS_LOG_DEBUG("Reading config file: {}", filename);

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return read_string(buffer.str(), filename);
}

ConfigSection ConfigReader::read_string(const std::string& content, const std::string& source) const {
    ConfigSection root("root");
    std::vector<Frame> frames{{&root, 0}};

    std::istringstream stream(content);
    std::string raw;
    int line_no = 0;
    while (std::getline(stream, raw)) {
        ++line_no;
        const std::string line = strip_comment(raw);
        std::string text = strip(line);
        if (text.empty()) continue;

        const int indent = indent_of(line);
        while (frames.size() > 1 && indent < frames.back().child_indent) {
            frames.pop_back();
        }
        ConfigSection* section = frames.back().section;

        const bool item = text[0] == '-' &&
                          (text.size() == 1 || std::isspace(static_cast<unsigned char>(text[1])));
        if (item) {
            section = &section->append_item();
            // Keys of the item sit past the dash
            frames.push_back({section, indent + 1});
            text = strip(text.substr(1));
            if (text.empty()) continue;
        }

        const auto colon = text.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw InvalidArgumentError(source + ":" + std::to_string(line_no) +
                                       ": expected 'key: value', got '" + text + "'");
        }
        const std::string key = strip(text.substr(0, colon));
        const std::string value = strip(text.substr(colon + 1));

        if (!value.empty()) {
            section->set(key, parse_value(value));
        } else if (item) {
            throw InvalidArgumentError(source + ":" + std::to_string(line_no) +
                                       ": list item '" + key + "' has no value");
        } else {
            frames.push_back({&section->subsection(key), indent + 1});
        }
    }
    return root;
}

ConfigValue ConfigReader::parse_value(const std::string& text) {
    const std::string s = strip(text);

    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }

    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        std::vector<std::string> tokens;
        std::istringstream items(s.substr(1, s.size() - 2));
        std::string tok;
        while (std::getline(items, tok, ',')) {
            tok = strip(tok);
            if (!tok.empty()) tokens.push_back(tok);
        }

        std::vector<Int> ints;
        std::vector<Real> reals;
        bool all_int = true;
        bool all_numeric = true;
        for (const auto& t : tokens) {
            ConfigValue v;
            if (!parse_number(t, v)) {
                all_numeric = false;
                break;
            }
            if (const auto* i = std::get_if<Int>(&v)) {
                ints.push_back(*i);
                reals.push_back(static_cast<Real>(*i));
            } else {
                all_int = false;
                reals.push_back(std::get<Real>(v));
            }
        }

        if (!all_numeric) {
            std::vector<std::string> strings;
            for (const auto& t : tokens) strings.push_back(unquote(t));
            return strings;
        }
        if (all_int && !ints.empty()) return ints;
        return reals;
    }

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;

    ConfigValue number;
    if (parse_number(s, number)) {
        return number;
    }
    return s;
}

} // namespace io
} // namespace pls
