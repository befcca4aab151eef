#pragma once

#include <custodia/state_db/database.hpp>
#include <custodia/state_db/state_delta.hpp>
#include <custodia/state_db/state_node.hpp>
#include <custodia/state_db/types.hpp>
