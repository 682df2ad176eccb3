#include "log_entry.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>

LogValue::LogValue(std::string s) : v_(std::move(s)) {}
LogValue::LogValue(const char *s) : v_(std::string(s ? s : "")) {}
LogValue::LogValue(double n) : v_(n) {}
LogValue::LogValue(LogObject obj) : v_(std::make_shared<const LogObject>(std::move(obj))) {}

std::optional<std::string> LogValue::as_string() const {
    if (auto s = std::get_if<std::string>(&v_)) return *s;
    return std::nullopt;
}

std::optional<double> LogValue::as_number() const {
    if (auto n = std::get_if<double>(&v_)) return *n;
    return std::nullopt;
}

const LogValue &LogValue::get(const std::string &key) const {
    static const LogValue absent;
    auto obj = std::get_if<std::shared_ptr<const LogObject>>(&v_);
    if (!obj || !*obj) return absent;
    auto it = (*obj)->find(key);
    if (it == (*obj)->end()) return absent;
    return it->second;
}

// null, booleans and arrays have no field meaning and decode as absent
static LogValue to_log_value(const nlohmann::json &node) {
    if (node.is_string()) return LogValue(node.get<std::string>());
    if (node.is_number()) return LogValue(node.get<double>());
    if (node.is_object()) {
        LogObject obj;
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj.emplace(it.key(), to_log_value(it.value()));
        }
        return LogValue(std::move(obj));
    }
    return LogValue();
}

std::optional<LogValue> decode_log_entry(const std::string &line) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error &) {
        return std::nullopt;
    }
    if (!root.is_object()) return std::nullopt;
    return to_log_value(root);
}

static std::string string_field(const LogValue &v) {
    auto s = v.as_string();
    return s ? *s : std::string();
}

std::string get_host(const LogValue &entry) {
    return string_field(entry.get("question").get("host"));
}

std::string get_reason(const LogValue &entry) {
    return string_field(entry.get("reason"));
}

std::string get_client(const LogValue &entry) {
    return string_field(entry.get("client"));
}

// NaN, infinities and negative durations would poison the cumulative sums
static std::optional<double> valid_ms(double ms) {
    if (!std::isfinite(ms) || ms < 0) return std::nullopt;
    return ms / 1000.0;
}

std::optional<double> get_elapsed_seconds(const LogValue &entry) {
    const LogValue &v = entry.get("elapsedMs");
    if (auto n = v.as_number()) return valid_ms(*n);
    auto s = v.as_string();
    if (!s || s->empty()) return std::nullopt;
    // plain decimal only: no sign, whitespace, hex or nan/inf spellings
    for (char c : *s) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.' && c != 'e' && c != 'E' && c != '+' && c != '-')
            return std::nullopt;
    }
    if (!std::isdigit(static_cast<unsigned char>((*s)[0]))) return std::nullopt;
    char *end = nullptr;
    double ms = std::strtod(s->c_str(), &end);
    if (end != s->c_str() + s->size()) return std::nullopt;
    return valid_ms(ms);
}

FilterCategory classify_reason(const std::string &reason) {
    if (reason == "FilteredBlackList") return FilterCategory::Lists;
    if (reason == "FilteredSafeBrowsing") return FilterCategory::SafeBrowsing;
    if (reason == "FilteredSafeSearch") return FilterCategory::SafeSearch;
    if (reason == "FilteredParental") return FilterCategory::Parental;
    return FilterCategory::None;
}
