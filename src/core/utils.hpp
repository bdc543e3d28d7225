#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Expand a leading "~" or "~/" to the user's home directory.
std::string expand_home(const std::string& path);

// Quote a word for a POSIX shell command line ('it'"'"'s').
std::string shell_quote(const std::string& word);

// Join words into one shell command line, quoting where needed.
std::string shell_join(const std::vector<std::string>& words);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Render a host template with {pod} and {namespace} placeholders.
// Err on unknown placeholders or malformed braces.
Result<std::string> render_host_template(const std::string& tmpl,
                                         const std::string& pod,
                                         const std::string& pod_namespace);
