#pragma once

#include <atomic>
#include <ctime>
#include <string>

#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>

namespace Terragraph
{

// Rotating file backend. Every log file it opens starts with a header naming
// the application build and the run it belongs to, so that rotated files of
// parallel runs can be told apart.
class LogSinkBackend : public boost::log::sinks::text_file_backend
{
private:
    std::string m_run_id;
    time_t      m_started = 0;

    // record of generated log files
    std::atomic<size_t> m_log_file_count { 0 };

public:
    LogSinkBackend(const std::string& file_pattern, const std::string& run_id, size_t rotation_size);

public:
    void consume(const boost::log::record_view& rec, const std::string& formatted_message);

    const std::string& run_id() const { return m_run_id; }
    size_t log_file_count() const { return m_log_file_count.load(); }

private:
    // write header to a freshly opened log file
    void write_header(std::ostream& file);
};

typedef boost::log::sinks::synchronous_sink<LogSinkBackend> LogSink;

} // namespace Terragraph
