#include "bootstrap.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <iostream>
#include <string>
#include <vector>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.examples") << std::endl;
    std::cerr << "  mboot" << std::endl;
    std::cerr << "  mboot alpha" << std::endl;
    std::cerr << "  mboot 5.0.1" << std::endl;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options("mboot", get_string("info.description"));
        options.custom_help(get_string("info.usage"));
        options.positional_help("[stable|latest|alpha|nightly|VERSION]");
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("s,silent", get_string("help.silent"), cxxopts::value<bool>()->default_value("false"))
            ("target", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"target"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        BootstrapOptions bootstrap;
        bootstrap.silent = result["silent"].as<bool>();
        if (result.count("target")) {
            const auto& targets = result["target"].as<std::vector<std::string>>();
            if (targets.size() > 1) {
                log_error(string_format("error.unexpected_argument", targets[1]));
                print_usage(options);
                return 1;
            }
            bootstrap.target = targets.front();
        }

        const Config config = load_config();
        run_bootstrap(bootstrap, config);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const InstallerExitException& e) {
        log_error(e.what());
        return e.exit_code();
    } catch (const InterruptedException& e) {
        log_error(e.what());
        return 128 + e.signal();
    } catch (const MbootException& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
