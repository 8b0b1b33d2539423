/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error presentation.
 *
 * This service standardizes how errors are categorized, reported, and logged
 * across the client, so the prompt and the log show the same wording.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "ftperror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,     ///< Control connection and authentication errors
    FileOperation,  ///< Transfer, data connection and local file errors
    Validation,     ///< Input, state and configuration errors
    Protocol        ///< Malformed or unexpected server replies
};

/**
 * @brief Severity levels determining how errors are logged.
 */
enum class ErrorSeverity {
    Info,      ///< Informational, e.g. a cancelled transfer
    Warning,   ///< Operation failed, session still usable
    Critical   ///< Connection-level failure
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation for the client:
 * - Categorizes FtpError kinds
 * - Logs with a "[Category/SEVERITY]" prefix at the matching Qt log level
 * - Emits a one-line status message for the prompt
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(session, &FtpSession::errorOccurred,
 *         handler, &ErrorHandler::handleFtpError);
 * connect(handler, &ErrorHandler::statusMessage,
 *         terminal, &TerminalSession::printStatus);
 *
 * handler->handleError(ErrorCategory::Validation,
 *                      ErrorSeverity::Warning,
 *                      "Invalid command",
 *                      "STOR requires filename");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    ~ErrorHandler() override = default;

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Handles an error reported by the FTP session.
     *
     * Category and severity follow from the error kind. FtpError values
     * without an error are ignored.
     */
    void handleFtpError(const FtpError &error);

    /**
     * @brief Handles a configuration load or validation failure (critical).
     */
    void handleConfigurationError(const QString &message);

    [[nodiscard]] static ErrorCategory categoryFor(FtpError::Kind kind);
    [[nodiscard]] static ErrorSeverity severityFor(FtpError::Kind kind);
    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted with the text to show at the prompt.
     */
    void statusMessage(const QString &message);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);
};

#endif // ERRORHANDLER_H
