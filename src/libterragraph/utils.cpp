#include "Utils.hpp"
#include "Exception.hpp"
#include "LogSink.hpp"

#include <cstdio>
#include <random>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

namespace Terragraph {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::error;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everything including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal : return 0;
    case boost::log::trivial::error : return 1;
    case boost::log::trivial::warning : return 2;
    case boost::log::trivial::info : return 3;
    case boost::log::trivial::debug : return 4;
    case boost::log::trivial::trace : return 5;
    default: return 1;
    }
}

unsigned level_string_to_number(const std::string &level)
{
    const std::string lower = boost::algorithm::to_lower_copy(level);
    if (lower == "fatal")   return 0;
    if (lower == "error")   return 1;
    if (lower == "warning") return 2;
    if (lower == "info")    return 3;
    if (lower == "debug")   return 4;
    if (lower == "trace")   return 5;
    if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '5')
        return unsigned(lower[0] - '0');
    throw ConfigError("Unknown log level: " + level);
}

// Report errors only until set_logging_level() is called, keeps the unit tests quiet.
static struct RunOnInit {
    RunOnInit() {
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= logSeverity);
    }
} g_RunOnInit;

static boost::shared_ptr<LogSink> g_log_sink;

std::string add_file_log(const std::string &log_dir, const std::string &run_id)
{
    namespace fs       = boost::filesystem;
    namespace expr     = boost::log::expressions;
    namespace keywords = boost::log::keywords;

    boost::system::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec)
        throw RuntimeError((boost::format("Cannot create log directory %1%: %2%") % log_dir % ec.message()).str());

    const std::string pattern = (fs::path(log_dir) / ("terragraph_" + run_id + "_%N.log")).string();
    // rotate every 20 MB
    auto backend = boost::make_shared<LogSinkBackend>(pattern, run_id, 20 * 1024 * 1024);

    if (g_log_sink) {
        boost::log::core::get()->remove_sink(g_log_sink);
        g_log_sink->flush();
    }
    g_log_sink = boost::make_shared<LogSink>(backend);
    g_log_sink->set_formatter(
        expr::stream
            << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "] "
            << "[" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
            << "[" << boost::log::trivial::severity << "]\t"
            << expr::smessage);

    boost::log::add_common_attributes();
    boost::log::core::get()->add_sink(g_log_sink);
    return pattern;
}

void flush_logs()
{
    if (g_log_sink)
        g_log_sink->flush();
}

std::string make_run_id()
{
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 0xffff);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04x%04x", dist(gen), dist(gen));
    return std::string(buf);
}

} // namespace Terragraph
