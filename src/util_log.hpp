#pragma once
#include <string>

// Thread-safe log sink: every line goes to stderr and is appended to the log file.
void safe_log(const std::string &s);

// Redirect the appended copy (default "statpulse.err.log"). Empty path disables the file copy.
void set_log_file(const std::string &path);
