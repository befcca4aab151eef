#pragma once

#include <custodia/encode/error.hpp>
#include <custodia/encode/hex.hpp>
