#include "globalvar.hpp"
#include "string_utils.hpp"
#include <cstdlib>
#include <iostream>
#include <thread>

namespace linescrub {

static std::string get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : "";
}

static bool env_is_true(const std::string& value) {
    std::string v = string_utils::strip(value);
    return !v.empty() && v != "0" && v != "false" && v != "no";
}

unsigned Settings::workers() const {
    if (worker_count > 0) return worker_count;
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

Settings Settings::from_environment() {
    Settings settings;

    std::string threads = string_utils::strip(get_env(globalvar::env_threads));
    if (!threads.empty()) {
        try {
            unsigned long n = std::stoul(threads);
            settings.worker_count = static_cast<unsigned>(n);
        } catch (const std::exception&) {
            std::cerr << "[linescrub] Warning: ignoring invalid " << globalvar::env_threads
                      << " value \"" << string_utils::make_printable(threads) << "\"\n";
        }
    }
    settings.use_jit = !env_is_true(get_env(globalvar::env_no_jit));
    settings.debug = env_is_true(get_env(globalvar::env_debug));
    return settings;
}

void debug_log(const Settings& settings, const std::string& message) {
    if (settings.debug) std::cerr << "[Debug] " << message << "\n";
}

} // namespace linescrub
