#include <lib/system/logger.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_settings.hpp>

namespace logger {
void initialize(const logging::settings& settings) {
  logging::add_common_attributes();

  // formatters
  logging::register_simple_formatter_factory<severity_level, char>(logging::trivial::tag::severity::get_name());
  // filters
  logging::register_simple_filter_factory<severity_level>(logging::trivial::tag::severity::get_name());

  if (settings.has_section("Sinks")) {
    logging::init_from_settings(settings);
    return;
  }

  // no sinks configured: warnings and errors go to the console
  if (settings.has_section("Core")) {
    logging::init_from_settings(settings);
  }
  logging::add_console_log(std::clog,
    logging::keywords::format = "[%TimeStamp%] %Severity%: %Message%",
    logging::keywords::filter = logging::trivial::severity >= logging::trivial::warning);
}

void cleanup() {
  logging::core::get()->remove_all_sinks();
}
}  // namespace logger
