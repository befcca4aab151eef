#pragma once

#include <custodia/controller/chronicler.hpp>
#include <custodia/controller/controller.hpp>
#include <custodia/controller/execution_context.hpp>
#include <custodia/controller/state.hpp>
