#include <custodia/log/log.hpp>

#include <chrono>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/ConsoleSink.h>

namespace custodia::log {

void initialize( const std::string& level )
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  if( !quill::Backend::is_running() )
  {
    quill::BackendOptions options;
    options.sleep_duration = sleep_duration;
    options.error_notifier = []( const std::string& err ) noexcept
    {
      LOG_ERROR( custodia::log::instance(), "Encountered backend logging error: {}", err );
    };

    quill::Backend::start( options );
  }

  instance()->set_log_level( quill::loglevel_from_string( level ) );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(tags)%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace custodia::log
