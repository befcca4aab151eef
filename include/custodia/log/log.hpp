#pragma once

#include <string>

#include <quill/LogMacros.h>

#include <custodia/log/formatter.hpp>
#include <custodia/log/frontend.hpp>

namespace custodia::log {

void initialize( const std::string& level = "info" );
logger* instance() noexcept;

} // namespace custodia::log
