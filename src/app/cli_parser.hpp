#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/exec_errors.hpp"

namespace snipexec::app::cli {
    snipexec::core::errors::Result<snipexec::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}
