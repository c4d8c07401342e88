#include <drift/utilities/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <drift/utilities/errors.h>

namespace drift {

static std::shared_ptr<spdlog::logger>
create_logger()
{
    auto existing = spdlog::get(logger_name);
    if (existing)
        return existing;
    try
    {
        return spdlog::stdout_color_mt(logger_name);
    }
    catch (spdlog::spdlog_ex&)
    {
        // Someone else registered it in the meantime.
        return spdlog::get(logger_name);
    }
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::shared_ptr<spdlog::logger> const logger = create_logger();
    return logger;
}

void
initialize_logging(spdlog::level::level_enum level)
{
    get_logger()->set_level(level);
}

spdlog::level::level_enum
parse_log_level(string const& name)
{
    auto level = spdlog::level::from_str(name);
    // from_str() maps anything it doesn't recognize to 'off', so make sure
    // that's actually what was asked for.
    if (level == spdlog::level::off && name != "off")
    {
        DRIFT_THROW(
            invalid_enum_string() << enum_id_info("log_level")
                                  << enum_string_info(name));
    }
    return level;
}

} // namespace drift
