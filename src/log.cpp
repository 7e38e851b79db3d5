#include <jsonpatch-cpp/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace jsonpatch_cpp {

namespace {

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get("jsonpatch")) return existing;
    auto created = spdlog::stderr_color_mt("jsonpatch");
    created->set_level(spdlog::level::warn);
    return created;
}

}  // anonymous namespace

auto logger() -> spdlog::logger& {
    static auto instance = make_logger();
    return *instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger().set_level(level);
}

}  // namespace jsonpatch_cpp
