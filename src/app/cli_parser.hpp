#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/pipeline_errors.hpp"

namespace sysintent::app::cli {
    sysintent::core::errors::Result<sysintent::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}
