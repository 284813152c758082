#pragma once

#include "parley/parley_config.hpp"
#include "parley/session.hpp"

// Build the demo command menu and run it in shell mode until "exit".
void run_shell(parley::Session& session, const parley::ParleyConfig& config);
