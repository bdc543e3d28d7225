#include "../podtun_cli.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_init(PodtunCLI& cli, const CommandArgs& args) {
    fs::path path = args.config_path ? fs::path(*args.config_path) : get_global_config_path();

    if (fs::exists(path)) {
        std::cout << theme::step(fmt::format("Config already exists at {}", path.string()));
        return 0;
    }

    auto result = create_default_config(path);
    if (result.is_err()) {
        std::cerr << theme::fail(result.error);
        return 1;
    }

    // The written file must load cleanly.
    auto loaded = Config::load_file(path);
    if (loaded.is_err()) {
        std::cerr << theme::fail(loaded.error);
        return 1;
    }

    std::cout << theme::ok(fmt::format("Wrote {}", path.string()));
    std::cout << theme::step("Edit portMappings and provider, then run 'podtun port-forward'.");
    return 0;
}

void register_setup_commands(PodtunCLI& cli) {
    cli.add_command("init", do_init, ArgSpec{}, "[-c PATH]",
                    "Write a default config file");
}
