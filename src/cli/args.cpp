#include "args.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

enum class Option { Config, Pod, Namespace, Timeout, Forward, User, Identity, Help, Unknown };

Option lookup(const std::string& name, const ArgSpec& spec) {
    if (name == "-c" || name == "--config") return Option::Config;
    if (name == "-p" || name == "--pod") return Option::Pod;
    if (name == "-n" || name == "--namespace") return Option::Namespace;
    if (name == "-t" || name == "--timeout") return Option::Timeout;
    if (name == "-h" || name == "--help") return Option::Help;
    if (spec.forwards && (name == "-L" || name == "--forward")) return Option::Forward;
    if (spec.ssh && (name == "-u" || name == "--user")) return Option::User;
    if (spec.ssh && (name == "-i" || name == "--identity")) return Option::Identity;
    return Option::Unknown;
}

} // namespace

Result<CommandArgs> parse_command_args(const std::vector<std::string>& argv, const ArgSpec& spec) {
    CommandArgs args;

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string& arg = argv[i];

        if (arg == "--") {
            if (spec.paths > 0) {
                args.paths.insert(args.paths.end(), argv.begin() + static_cast<long>(i) + 1, argv.end());
                break;
            }
            if (!spec.trailing_command) {
                return Result<CommandArgs>::Err("unexpected '--'");
            }
            args.command.assign(argv.begin() + static_cast<long>(i) + 1, argv.end());
            break;
        }

        if (arg.size() < 2 || arg[0] != '-') {
            if (spec.paths > 0) {
                args.paths.push_back(arg);
                continue;
            }
            if (!spec.trailing_command) {
                return Result<CommandArgs>::Err(fmt::format("unexpected argument '{}'", arg));
            }
            args.command.assign(argv.begin() + static_cast<long>(i), argv.end());
            break;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        Option option = lookup(name, spec);
        if (option == Option::Unknown) {
            return Result<CommandArgs>::Err(fmt::format("unknown option '{}'", name));
        }
        if (option == Option::Help) {
            args.help = true;
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argv.size()) {
            value = argv[++i];
        } else {
            return Result<CommandArgs>::Err(fmt::format("option '{}' requires a value", name));
        }

        switch (option) {
            case Option::Config:    args.config_path = expand_home(value); break;
            case Option::Pod:       args.pod_name = value; break;
            case Option::Namespace: args.pod_namespace = value; break;
            case Option::Timeout: {
                int secs = safe_stoi(value, -1);
                if (secs <= 0) {
                    return Result<CommandArgs>::Err(fmt::format("invalid timeout '{}'", value));
                }
                args.timeout_secs = secs;
                break;
            }
            case Option::Forward:   args.forwards.push_back(value); break;
            case Option::User:      args.ssh_user = value; break;
            case Option::Identity:  args.identity_file = expand_home(value); break;
            case Option::Help:
            case Option::Unknown:
                break;
        }
    }

    if (spec.paths > 0 && !args.help && args.paths.size() != spec.paths) {
        return Result<CommandArgs>::Err(
            fmt::format("expected {} path arguments, got {}", spec.paths, args.paths.size()));
    }

    return Result<CommandArgs>::Ok(args);
}
