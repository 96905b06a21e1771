#pragma once

#include "masklint/commands/dump_command.hpp"
#include "masklint/commands/run_command.hpp"
