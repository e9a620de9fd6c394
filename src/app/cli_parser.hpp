#pragma once
#include <string>
#include "protocol/launch_request.hpp"
#include "core/errors/launch_errors.hpp"

namespace flowlaunch::app::cli {
    flowlaunch::core::errors::Result<flowlaunch::protocol::LaunchRequest> parse_and_validate(int argc, char* argv[]);

    bool wants_help(int argc, char* argv[]);
    std::string usage(const std::string& program);
}
