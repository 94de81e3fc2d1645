/** \file
 *
 * \brief Process logging utilities
 *
 * These utilities are for diagnostics of the process itself. The in‐game log
 * shown to the players is maintained by Coup::Engine::GameState.
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <ostream>

#include "IoUtility.hh"

namespace Coup {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream().write(std::addressof(*first), last - first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void log(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        log(first, iter);
    } else {
        logStream().write(std::addressof(*first), iter - first);
        // Brings the operator<< overloads of the Coup namespace (optionals,
        // variants, domain types) into consideration
        {
            using Coup::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * The \p format string is inspired by the standard C formatting string, but
 * the type given by the specifier is ignored. Each \p ts is streamed to the
 * log stream as is, and exactly one character following the \% sign is
 * skipped.
 *
 * \note Not thread safe. Only one thread should log at a time.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        const auto first = std::begin(format);
        auto last = std::end(format);
        // Do not output the terminating null of a string literal
        if (first != last && *std::prev(last) == '\0') {
            --last;
        }
        Impl::log(first, last, ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Default mapping between verbosity and logging level
 *
 * \param verbosity the verbosity level (typically the number of times -v flag
 * is given)
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Setup logging utility
 *
 * This function sets up the (global) minimum logging level and the stream to
 * which the log is output.
 *
 * If this method is not called, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
