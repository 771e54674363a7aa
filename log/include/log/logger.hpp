#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    class Logger
    {
      public:
        Logger()
            : guard_{}
            , sink_{}
        {}

        /**
         * @brief Replaces the spdlog logger that receives all messages.
         *
         * @param sink Passing nullptr reverts to the default stderr logger.
         */
        void setup(std::shared_ptr<spdlog::logger> sink)
        {
            std::scoped_lock lock{guard_};
            const auto lvl = sink_ ? sink_->level() : spdlog::level::info;
            sink_ = std::move(sink);
            if (sink_)
                sink_->set_level(lvl);
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            ensureSink();
            sink_->set_level(toSpdlogLevel(level));
        }

        Log::Level level()
        {
            std::scoped_lock lock{guard_};
            ensureSink();
            return fromSpdlogLevel(sink_->level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::shared_ptr<spdlog::logger> sink;
            {
                std::scoped_lock lock{guard_};
                ensureSink();
                sink = sink_;
            }
            sink->log(toSpdlogLevel(level), msg);
        }

      private:
        void ensureSink()
        {
            if (sink_)
                return;

            sink_ = spdlog::get("net-scp");
            if (!sink_)
                sink_ = spdlog::stderr_color_mt("net-scp");
        }

      private:
        std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> sink_;
    };
}
