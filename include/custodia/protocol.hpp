#pragma once

#include <custodia/protocol/account.hpp>
#include <custodia/protocol/amount.hpp>
#include <custodia/protocol/event.hpp>
#include <custodia/protocol/permit.hpp>
