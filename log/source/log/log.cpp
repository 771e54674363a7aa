#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setupLogger(std::shared_ptr<spdlog::logger> sink)
    {
        Detail::logger.setup(std::move(sink));
    }
}
