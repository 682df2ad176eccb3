#include "body_params.hpp"
#include "util_log.hpp"
#include <cctype>

static std::string trim(const std::string &s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

std::optional<std::map<std::string,std::string>> parse_parameters_from_body(std::istream &in) {
    std::map<std::string,std::string> parameters;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            safe_log(std::string("parse_parameters_from_body: invalid line ") + std::to_string(lineno)
                     + ": " + line);
            return std::nullopt;
        }
        parameters[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return parameters;
}
