#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/run_errors.hpp"

namespace overseer::app::cli {
    overseer::core::errors::Result<overseer::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
