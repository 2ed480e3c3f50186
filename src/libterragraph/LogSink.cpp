#include "LogSink.hpp"

#include "libterragraph_version.h"

#include <ostream>

#include <boost/date_time/posix_time/posix_time.hpp>

#define HEADER_BEGIN_MARKER "BEGIN_HEADER"
#define HEADER_END_MARKER   "END_HEADER"

namespace Terragraph
{

LogSinkBackend::LogSinkBackend(const std::string& file_pattern, const std::string& run_id, size_t rotation_size)
    : m_run_id(run_id)
    , m_started(std::time(nullptr))
{
    set_file_name_pattern(file_pattern);
    set_rotation_size(rotation_size);
    set_auto_newline_mode(boost::log::sinks::insert_if_missing);
    set_open_mode(std::ios::out | std::ios::app);
    set_open_handler([this](std::ostream& file) { this->write_header(file); });
}

// warning: do not use BOOST_LOG_TRIVIAL in this function to avoid deadlock
void LogSinkBackend::write_header(std::ostream& file)
{
    const size_t index = ++m_log_file_count;
    file << HEADER_BEGIN_MARKER << "\n"
         << "app_name: " << TERRAGRAPH_APP_NAME << "\n"
         << "app_version: " << TERRAGRAPH_VERSION << "\n"
         << "build_id: " << TERRAGRAPH_BUILD_ID << "\n"
         << "run_id: " << m_run_id << "\n"
         << "run_started: " << boost::posix_time::to_simple_string(boost::posix_time::from_time_t(m_started)) << "\n"
         << "file_index: " << index << "\n"
         << HEADER_END_MARKER << "\n";
}

// warning: do not use BOOST_LOG_TRIVIAL in this function to avoid deadlock
void LogSinkBackend::consume(const boost::log::record_view& rec, const std::string& formatted_message)
{
    if (formatted_message.empty())
        return;
    text_file_backend::consume(rec, formatted_message);
}

} // namespace Terragraph
