#pragma once

#include <custodia/token/allowance_table.hpp>
#include <custodia/token/asset_escrow.hpp>
#include <custodia/token/delegated_authorization.hpp>
#include <custodia/token/deposit_withdraw.hpp>
#include <custodia/token/descriptor.hpp>
#include <custodia/token/error.hpp>
#include <custodia/token/ledger.hpp>
#include <custodia/token/native_escrow.hpp>
#include <custodia/token/state.hpp>
#include <custodia/token/system_interface.hpp>
#include <custodia/token/transfer_guard.hpp>
