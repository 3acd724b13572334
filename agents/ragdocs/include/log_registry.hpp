#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

struct LogConfig {
    std::filesystem::path dir{"logs"};
    std::string console_level{"info"};
    std::string file_level{"debug"};
};

class LogRegistry {
public:
    // Creates the shared sinks and one logger per subsystem. Safe to call twice.
    static void init(const LogConfig& cfg);

    // Falls back to a console-only logger when init() has not run yet.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> tracker()   { return get("tracker"); }
    static std::shared_ptr<spdlog::logger> segmenter() { return get("segmenter"); }
    static std::shared_ptr<spdlog::logger> embed()     { return get("embed"); }
    static std::shared_ptr<spdlog::logger> store()     { return get("store"); }
    static std::shared_ptr<spdlog::logger> engine()    { return get("engine"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    static bool initialized();

private:
    static std::mutex mtx_;
    static bool initialized_;
};
