#ifndef libterragraph_Utils_hpp_
#define libterragraph_Utils_hpp_

#include <string>

namespace Terragraph {

// Set a log level for the trivial Boost logger.
// 0 - fatal
// 1 - error
// 2 - warning
// 3 - info
// 4 - debug
// 5 - trace
extern void set_logging_level(unsigned int level);
extern unsigned get_logging_level();
// Translate "warning", "info" etc. or a number 0..5 to the numeric level, throws ConfigError otherwise.
extern unsigned level_string_to_number(const std::string &level);

// Install the rotating file sink writing into log_dir. Returns the log file pattern.
extern std::string add_file_log(const std::string &log_dir, const std::string &run_id);
extern void flush_logs();

// Short random identifier of a pipeline run, used in log headers.
extern std::string make_run_id();

} // namespace Terragraph

#endif // libterragraph_Utils_hpp_
