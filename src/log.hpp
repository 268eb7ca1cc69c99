#pragma once

// Installs the colored "tabdeck" console logger as the spdlog default.
// Verbose mode lowers the level to debug.
void init_logging(bool verbose);
