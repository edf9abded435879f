#include <XNS/Logging.hpp>

#include <dlib/logger.h>

namespace XNS::Logging
{
    namespace
    {
        // Parent of every xns.* logger; dlib propagates level and stream changes to children.
        dlib::logger g_root("xns");

        [[nodiscard]] dlib::log_level ToDlib(LogLevel level) noexcept
        {
            switch (level)
            {
                case LogLevel::All:
                    return dlib::LALL;
                case LogLevel::Trace:
                    return dlib::LTRACE;
                case LogLevel::Debug:
                    return dlib::LDEBUG;
                case LogLevel::Info:
                    return dlib::LINFO;
                case LogLevel::Warn:
                    return dlib::LWARN;
                case LogLevel::Error:
                    return dlib::LERROR;
                case LogLevel::Fatal:
                    return dlib::LFATAL;
                case LogLevel::None:
                    return dlib::LNONE;
            }
            Unreachable();
        }
    }// namespace

    void SetLevel(LogLevel level)
    {
        g_root.set_level(ToDlib(level));
    }

    void Configure(LogLevel level, std::ostream& output)
    {
        g_root.set_level(ToDlib(level));
        g_root.set_output_stream(output);
    }
}// namespace XNS::Logging
