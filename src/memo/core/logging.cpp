#include <memo/core/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace memo {

char const* const memo_logger_name = "memo";

std::shared_ptr<spdlog::logger>
get_memo_logger()
{
    static std::mutex creation_mutex;
    std::lock_guard<std::mutex> lock(creation_mutex);
    auto logger = spdlog::get(memo_logger_name);
    if (!logger)
        logger = spdlog::stderr_color_mt(memo_logger_name);
    return logger;
}

void
initialize_logging(string const& level)
{
    get_memo_logger()->set_level(spdlog::level::from_str(level));
}

} // namespace memo
