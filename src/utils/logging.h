/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace raxftp {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace raxftp

/// Log only when verbose mode is enabled (per-chunk transfer traffic, raw reply lines)
#define LOG_VERBOSE() if (raxftp::verboseLogging) qDebug()

#endif // LOGGING_H
