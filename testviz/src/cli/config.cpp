#include "config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace testviz::cli {

auto parse_color_mode(std::string_view text) -> std::optional<ColorMode> {
    if (text == "auto")
        return ColorMode::Auto;
    if (text == "always")
        return ColorMode::Always;
    if (text == "never")
        return ColorMode::Never;
    return std::nullopt;
}

auto color_mode_name(ColorMode mode) -> const char* {
    switch (mode) {
    case ColorMode::Auto:
        return "auto";
    case ColorMode::Always:
        return "always";
    case ColorMode::Never:
        return "never";
    }
    return "auto";
}

auto ConfigError::to_string() const -> std::string {
    if (line > 0) {
        return message + " (line " + std::to_string(line) + ")";
    }
    return message;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(std::string content) : content_(std::move(content)) {}

auto SimpleTomlParser::advance() -> char {
    char c = content_[pos_++];
    if (c == '\n')
        ++line_;
    return c;
}

void SimpleTomlParser::fail(const std::string& message) {
    if (!error_) {
        error_ = ConfigError{message, line_};
    }
}

void SimpleTomlParser::skip_blanks() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '#') {
            skip_comment();
        } else {
            break;
        }
    }
}

auto SimpleTomlParser::expect_line_end() -> bool {
    skip_blanks();
    if (peek() == '#')
        skip_comment();
    if (is_eof())
        return true;
    if (peek() == '\n') {
        advance();
        return true;
    }
    fail(std::string("unexpected '") + peek() + "' at end of line");
    return false;
}

auto SimpleTomlParser::parse_identifier() -> std::string {
    std::string result;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            result += advance();
        } else {
            break;
        }
    }
    return result;
}

auto SimpleTomlParser::parse_string() -> std::optional<std::string> {
    advance(); // opening quote

    std::string result;
    while (true) {
        if (is_eof() || peek() == '\n') {
            fail("unterminated string");
            return std::nullopt;
        }

        char c = advance();
        if (c == '"')
            return result;
        if (c != '\\') {
            result += c;
            continue;
        }

        char escaped = is_eof() ? '\0' : advance();
        switch (escaped) {
        case '"':
            result += '"';
            break;
        case '\\':
            result += '\\';
            break;
        case 'n':
            result += '\n';
            break;
        case 't':
            result += '\t';
            break;
        case 'r':
            result += '\r';
            break;
        default:
            fail(std::string("unsupported escape sequence '\\") + escaped + "'");
            return std::nullopt;
        }
    }
}

auto SimpleTomlParser::parse_number() -> std::optional<double> {
    std::string text;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.') {
            text += advance();
        } else if (c == '_') {
            advance();
        } else {
            break;
        }
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        fail("invalid number '" + text + "'");
        return std::nullopt;
    }
    return value;
}

auto SimpleTomlParser::parse_boolean() -> std::optional<bool> {
    std::string word = parse_identifier();
    if (word == "true")
        return true;
    if (word == "false")
        return false;
    fail("invalid value '" + word + "'");
    return std::nullopt;
}

auto SimpleTomlParser::parse_string_array() -> std::optional<std::vector<std::string>> {
    advance(); // '['

    std::vector<std::string> items;
    while (true) {
        skip_whitespace();
        if (is_eof()) {
            fail("unterminated array");
            return std::nullopt;
        }
        if (peek() == ']') {
            advance();
            return items;
        }
        if (peek() != '"') {
            fail("arrays may only contain strings");
            return std::nullopt;
        }

        auto item = parse_string();
        if (!item)
            return std::nullopt;
        items.push_back(std::move(*item));

        skip_whitespace();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            fail("expected ',' or ']' in array");
            return std::nullopt;
        }
    }
}

auto SimpleTomlParser::parse_value() -> std::optional<TomlValue> {
    char c = peek();
    if (c == '"') {
        auto value = parse_string();
        return value ? std::optional<TomlValue>(std::in_place, std::in_place_type<std::string>,
                                               std::move(*value))
                     : std::nullopt;
    }
    if (c == '[') {
        auto value = parse_string_array();
        return value ? std::optional<TomlValue>(std::in_place,
                                                std::in_place_type<std::vector<std::string>>,
                                                std::move(*value))
                     : std::nullopt;
    }
    if (c == 't' || c == 'f') {
        auto value = parse_boolean();
        return value ? std::optional<TomlValue>(std::in_place, std::in_place_type<bool>, *value)
                     : std::nullopt;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.') {
        auto value = parse_number();
        return value ? std::optional<TomlValue>(std::in_place, std::in_place_type<double>, *value)
                     : std::nullopt;
    }

    fail("expected a value");
    return std::nullopt;
}

auto SimpleTomlParser::parse() -> Result<TomlDocument, ConfigError> {
    TomlDocument document;
    std::string section;

    while (!error_) {
        skip_whitespace();
        if (is_eof())
            break;

        if (peek() == '[') {
            advance();
            skip_blanks();
            std::string name = parse_identifier();
            skip_blanks();
            if (name.empty()) {
                fail("expected a section name");
                break;
            }
            if (peek() != ']') {
                fail("expected ']' after section name");
                break;
            }
            advance();
            if (!expect_line_end())
                break;

            section = name;
            document[section];
            continue;
        }

        int key_line = line_;
        std::string key = parse_identifier();
        if (key.empty()) {
            fail(std::string("unexpected '") + peek() + "'");
            break;
        }
        skip_blanks();
        if (peek() != '=') {
            fail("expected '=' after key '" + key + "'");
            break;
        }
        advance();
        skip_blanks();

        auto value = parse_value();
        if (!value)
            break;

        auto& table = document[section];
        if (table.count(key) > 0) {
            error_ = ConfigError{"duplicate key '" + key + "'", key_line};
            break;
        }
        table.emplace(key, std::move(*value));

        expect_line_end();
    }

    if (error_) {
        return *error_;
    }
    return document;
}

// ============================================================================
// Loading
// ============================================================================

static auto type_error(const std::string& section, const std::string& key, const char* expected)
    -> ConfigError {
    return ConfigError{"'" + section + "." + key + "' must be " + expected, 0};
}

auto apply_toml(const TomlDocument& document, Configuration base)
    -> Result<Configuration, ConfigError> {
    for (const auto& [section, table] : document) {
        for (const auto& [key, value] : table) {
            if (section == "thresholds" && (key == "fast" || key == "normal")) {
                const double* seconds = std::get_if<double>(&value);
                if (!seconds) {
                    return type_error(section, key, "a number");
                }
                (key == "fast" ? base.threshold_fast : base.threshold_normal) = *seconds;
            } else if (section == "names" && (key == "no_split" || key == "no_transform")) {
                const auto* list = std::get_if<std::vector<std::string>>(&value);
                if (!list) {
                    return type_error(section, key, "an array of strings");
                }
                (key == "no_split" ? base.naming.no_split : base.naming.no_transform) = *list;
            } else if (section == "output" && key == "color") {
                const auto* text = std::get_if<std::string>(&value);
                auto mode = text ? parse_color_mode(*text) : std::nullopt;
                if (!mode) {
                    return type_error(section, key, "one of \"auto\", \"always\", \"never\"");
                }
                base.color = *mode;
            } else {
                TESTVIZ_LOG_WARN("config", "Ignoring unknown setting '"
                                               << (section.empty() ? key : section + "." + key)
                                               << "'");
            }
        }
    }
    return base;
}

auto load_config(const std::string& path) -> Result<Configuration, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{"cannot open configuration file: " + path, 0};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = SimpleTomlParser(buffer.str()).parse();
    if (is_err(parsed)) {
        auto error = unwrap_err(parsed);
        error.message = path + ": " + error.message;
        return error;
    }

    auto applied = apply_toml(unwrap(parsed), Configuration{});
    if (is_err(applied)) {
        auto error = unwrap_err(applied);
        error.message = path + ": " + error.message;
        return error;
    }

    auto config = unwrap(applied);
    config.source = path;
    TESTVIZ_LOG_INFO("config", "Loaded configuration from " << path);
    return config;
}

static auto parse_seconds(std::string_view text) -> std::optional<double> {
    std::string value(text);
    char* end = nullptr;
    double seconds = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size()) {
        return std::nullopt;
    }
    return seconds;
}

auto apply_overrides(Configuration& config, const std::vector<std::string>& args)
    -> std::optional<ConfigError> {
    static const std::string FAST = "--threshold-fast=";
    static const std::string NORMAL = "--threshold-normal=";
    static const std::string COLOR = "--color=";

    for (const auto& arg : args) {
        if (arg.starts_with(FAST) || arg.starts_with(NORMAL)) {
            bool fast = arg.starts_with(FAST);
            std::string_view text = std::string_view(arg).substr(fast ? FAST.size() : NORMAL.size());
            auto seconds = parse_seconds(text);
            if (!seconds) {
                return ConfigError{"invalid number '" + std::string(text) + "' for " +
                                       (fast ? "--threshold-fast" : "--threshold-normal"),
                                   0};
            }
            (fast ? config.threshold_fast : config.threshold_normal) = *seconds;
        } else if (arg.starts_with(COLOR)) {
            auto mode = parse_color_mode(std::string_view(arg).substr(COLOR.size()));
            if (!mode) {
                return ConfigError{"invalid value for --color: expected auto, always or never",
                                   0};
            }
            config.color = *mode;
        } else if (arg == "--no-color") {
            config.color = ColorMode::Never;
        }
    }
    return std::nullopt;
}

auto validate(const Configuration& config) -> std::optional<ConfigError> {
    if (!std::isfinite(config.threshold_fast) || !std::isfinite(config.threshold_normal)) {
        return ConfigError{"thresholds must be finite numbers", 0};
    }
    if (config.threshold_fast < 0.0 || config.threshold_normal < 0.0) {
        return ConfigError{"thresholds must not be negative", 0};
    }
    if (config.threshold_fast > config.threshold_normal) {
        std::ostringstream oss;
        oss << "threshold fast (" << config.threshold_fast << ") exceeds threshold normal ("
            << config.threshold_normal << ")";
        return ConfigError{oss.str(), 0};
    }
    return std::nullopt;
}

auto resolve_config(const std::vector<std::string>& args) -> Result<Configuration, ConfigError> {
    static const std::string CONFIG = "--config=";

    std::string path;
    for (const auto& arg : args) {
        if (arg.starts_with(CONFIG)) {
            path = arg.substr(CONFIG.size());
        }
    }

    std::error_code ec;
    if (path.empty() && fs::is_regular_file(DEFAULT_CONFIG_FILE, ec)) {
        path = DEFAULT_CONFIG_FILE;
    }

    Configuration config;
    if (!path.empty()) {
        auto loaded = load_config(path);
        if (is_err(loaded)) {
            return unwrap_err(loaded);
        }
        config = std::move(unwrap(loaded));
    }

    if (auto error = apply_overrides(config, args)) {
        return *error;
    }
    if (auto error = validate(config)) {
        return *error;
    }

    TESTVIZ_LOG_DEBUG("config", "thresholds fast=" << config.threshold_fast
                                                   << " normal=" << config.threshold_normal
                                                   << ", color=" << color_mode_name(config.color));
    return config;
}

auto use_colors(ColorMode mode, bool is_terminal) -> bool {
    switch (mode) {
    case ColorMode::Always:
        return true;
    case ColorMode::Never:
        return false;
    case ColorMode::Auto:
        break;
    }
    return is_terminal;
}

} // namespace testviz::cli
