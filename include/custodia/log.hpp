#pragma once

#include <custodia/log/log.hpp>
