#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/tandem_errors.hpp"

namespace tandem::app::cli {
    // `tandemd serve [flags]`: --config is applied first, explicit flags win.
    tandem::core::errors::Result<tandem::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);
}
