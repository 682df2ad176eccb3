#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

class LogValue;
using LogObject = std::map<std::string, LogValue>;

// Decoded query-log value: absent, string, number or nested object.
// Accessors narrow to the requested shape and yield empty/absent on mismatch.
class LogValue {
public:
    LogValue() = default;
    LogValue(std::string s);
    LogValue(const char *s);
    LogValue(double n);
    LogValue(LogObject obj);

    bool is_absent() const noexcept { return std::holds_alternative<std::monostate>(v_); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v_); }
    bool is_number() const noexcept { return std::holds_alternative<double>(v_); }
    bool is_object() const noexcept { return std::holds_alternative<std::shared_ptr<const LogObject>>(v_); }

    std::optional<std::string> as_string() const;
    std::optional<double> as_number() const;

    // Member lookup; absent when this is not an object or the key is missing.
    const LogValue &get(const std::string &key) const;

private:
    std::variant<std::monostate, std::string, double, std::shared_ptr<const LogObject>> v_;
};

enum class FilterCategory {
    None,
    Lists,
    SafeBrowsing,
    SafeSearch,
    Parental
};

// Decode one JSON object line. Strings, numbers and objects keep their shape;
// null, booleans and arrays decode as absent. Non-object lines are rejected.
std::optional<LogValue> decode_log_entry(const std::string &line);

// Field extraction: "" when the field is missing or not a string.
std::string get_host(const LogValue &entry);    // question.host
std::string get_reason(const LogValue &entry);  // reason
std::string get_client(const LogValue &entry);  // client

// elapsedMs as seconds; accepts a number or a plain decimal string.
// Negative or non-finite values give nullopt.
std::optional<double> get_elapsed_seconds(const LogValue &entry);

FilterCategory classify_reason(const std::string &reason);
