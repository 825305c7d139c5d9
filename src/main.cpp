#include <iostream>
#include <string>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <fmt/format.h>
#include "cli/args.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "managers/proxy_service.hpp"
#include "platform/platform.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void on_signal(int) {
    g_shutdown_requested = 1;
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

// YAML file, then environment, then command line.
Result<ProxySettings> load_settings(const CliOptions& cli) {
    ProxySettings settings;

    std::optional<std::string> config_path = cli.config_path;
    if (!config_path) {
        if (const char* env = std::getenv(CONFIG_PATH_ENV)) config_path = env;
    }
    if (config_path) {
        auto r = load_settings_file(*config_path, settings);
        if (r.is_err()) return Result<ProxySettings>::Err(r.kind, r.error);
    }

    auto env = apply_settings_env(settings);
    if (env.is_err()) return Result<ProxySettings>::Err(env.kind, env.error);

    auto flags = apply_cli(settings, cli);
    if (flags.is_err()) return Result<ProxySettings>::Err(flags.kind, flags.error);

    auto valid = validate_settings(settings);
    if (valid.is_err()) return Result<ProxySettings>::Err(valid.kind, valid.error);

    return Result<ProxySettings>::Ok(settings);
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = "data-stream";

    try {
        auto cli = parse_args(argc, argv);
        if (cli.is_err()) {
            std::cerr << usage_text(program) << program << ": error: " << cli.error << "\n";
            return 2;
        }
        if (cli.value.show_help) {
            std::cout << usage_text(program);
            return 0;
        }
        if (cli.value.show_version) {
            std::cout << program << " version " << DS_VERSION << "\n";
            return 0;
        }

        auto settings = load_settings(cli.value);
        if (settings.is_err()) {
            std::cerr << usage_text(program) << program << ": error: " << settings.error << "\n";
            return 2;
        }

        ds_log_configure(settings.value.log_file, settings.value.verbose);
        install_signal_handlers();

        ProxyService service(settings.value);
        auto started = service.start();
        if (started.is_err()) {
            ds_error(fmt::format("Startup failed: {}", started.error));
            return 1;
        }

        while (!g_shutdown_requested) {
            platform::sleep_ms(ACCEPT_POLL_MS);
        }

        service.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return 1;
    }
}
