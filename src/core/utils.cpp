#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <stdexcept>

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) return (platform::home_dir() / path.substr(2)).string();
    return path;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";
    bool plain = true;
    for (char c : word) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                    c == '/' || c == '=' || c == ':' || c == ',' || c == '@' || c == '+';
        if (!safe) { plain = false; break; }
    }
    if (plain) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\"'\"'";
        else out += c;
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += shell_quote(w);
    }
    return out;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int value = std::stoi(s, &pos);
        return pos == s.size() ? value : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

Result<std::string> render_host_template(const std::string& tmpl,
                                         const std::string& pod,
                                         const std::string& pod_namespace) {
    try {
        std::string host = fmt::format(fmt::runtime(tmpl),
                                       fmt::arg("pod", pod),
                                       fmt::arg("namespace", pod_namespace));
        if (host.empty()) return Result<std::string>::Err("host template renders an empty host");
        return Result<std::string>::Ok(host);
    } catch (const fmt::format_error& e) {
        return Result<std::string>::Err(
            fmt::format("invalid host template '{}': {}", tmpl, e.what()));
    }
}
