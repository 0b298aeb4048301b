#pragma once

namespace code_interpreter {

// Routes the default spdlog logger to stderr (stdout belongs to tool
// results and to sandbox output capture) and picks the level:
// debug if `debug` or DEBUG=true|1|yes, info if `verbose`, warn otherwise.
void configure_logging(bool verbose, bool debug = false);

}
