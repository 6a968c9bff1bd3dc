#pragma once

#include <functional>
#include <string>

#include <rr/helpers/types.hpp>
#include <rr/core/errors/error.hpp>

namespace rr::core {

    /**
     * @brief Routes resolver messages to the caller supplied sinks
     * @note Debug and Info messages go to the message sink, Warning and Error messages carry a diagnostic code
     */
    class LogConsole {
    public:
        enum class Level : u8 {
            Debug       = 0,
            Info        = 1,
            Warning     = 2,
            Error       = 3
        };

        using MessageCallback    = std::function<void(const std::string &message)>;
        using DiagnosticCallback = std::function<void(const std::string &code, const std::string &message)>;

        void log(Level level, const std::string &message, const std::string &code = { }) const {
            if (u8(level) < u8(this->m_logLevel))
                return;

            switch (level) {
                using enum Level;

                case Debug:
                case Info:
                    if (this->m_messageCallback)
                        this->m_messageCallback(message);
                    break;
                case Warning:
                    if (this->m_warningCallback)
                        this->m_warningCallback(code, message);
                    break;
                case Error:
                    if (this->m_errorCallback)
                        this->m_errorCallback(code, message);
                    break;
            }
        }

        void debug(const std::string &message) const {
            this->log(Level::Debug, message);
        }

        void warning(const std::string &code, const std::string &message) const {
            this->log(Level::Warning, message, code);
        }

        void warning(const err::Diagnostic::Exception &exception) const {
            this->log(Level::Warning, exception.getDescription(), exception.getCode());
        }

        void error(const std::string &code, const std::string &message) const {
            this->log(Level::Error, message, code);
        }

        void setLogLevel(Level level) {
            this->m_logLevel = level;
        }

        [[nodiscard]] Level getLogLevel() const {
            return this->m_logLevel;
        }

        void setMessageCallback(const MessageCallback &callback) {
            this->m_messageCallback = callback;
        }

        void setWarningCallback(const DiagnosticCallback &callback) {
            this->m_warningCallback = callback;
        }

        void setErrorCallback(const DiagnosticCallback &callback) {
            this->m_errorCallback = callback;
        }

    private:
        Level m_logLevel = Level::Info;

        MessageCallback m_messageCallback;
        DiagnosticCallback m_warningCallback;
        DiagnosticCallback m_errorCallback;
    };

}
