#include "../include/log_registry.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

std::mutex LogRegistry::mtx_;
bool LogRegistry::initialized_ = false;

static const char* kSubsystems[] = {"tracker", "segmenter", "embed", "store", "engine", "cli"};

void LogRegistry::init(const LogConfig& cfg) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(cfg.dir, ec);
    if (ec) throw std::runtime_error("cannot create log directory " + cfg.dir.string() + ": " + ec.message());

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(spdlog::level::from_str(cfg.console_level));
    console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

    auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (cfg.dir / "ragdocs.log").string(), 1024 * 1024 * 10, 5);
    rotating->set_level(spdlog::level::from_str(cfg.file_level));

    for (const char* name : kSubsystems) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{console, rotating});
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto logger = spdlog::get(name);
    if (logger) return logger;
    if (initialized_) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return spdlog::stdout_color_mt(name);
}

bool LogRegistry::initialized() {
    std::lock_guard<std::mutex> lock(mtx_);
    return initialized_;
}
