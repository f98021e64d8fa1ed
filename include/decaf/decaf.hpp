#pragma once

#include "command.hpp"
#include "config.hpp"
#include "executor.hpp"
#include "format.hpp"
#include "registry.hpp"
#include "server.hpp"
#include "session.hpp"
#include "utils.hpp"
