#pragma once

#include <custodia/memory/memory.hpp>
