#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Route every spdlog call to one file. stdout is left to command output.
    inline void init(const std::string& file = "fastmem.log", bool verbose = false)
    {
        auto sink_logger = spdlog::basic_logger_mt("fastmem", file);
        spdlog::set_default_logger(sink_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");
        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        // info and above reach the disk before the command returns
        spdlog::flush_on(spdlog::level::info);
    }

    // Tests and embedders that do not want any output.
    inline void silence()
    {
        spdlog::set_level(spdlog::level::off);
    }
}
