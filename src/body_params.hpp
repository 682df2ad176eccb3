#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>

// Parse "key=value" lines. Blank lines are skipped, each line splits on its
// first '=', and both sides are trimmed. A line without '=' rejects the whole input.
std::optional<std::map<std::string,std::string>> parse_parameters_from_body(std::istream &in);
