#pragma once

#include <rr/helpers/types.hpp>

#include <exception>
#include <string>
#include <utility>

namespace rr::core::err {

    namespace impl {
        std::string formatDiagnosticCode(char prefix, u32 errorCode);
        std::string formatDiagnostic(const std::string &title, const std::string &description);
    }

    /**
     * @brief A diagnostic with a stable code that is reported through the warning and error sinks
     */
    class Diagnostic {
    public:
        class Exception : public std::exception {
        public:
            Exception(std::string code, std::string title, std::string description) :
                    m_code(std::move(code)), m_title(std::move(title)), m_description(std::move(description)) {
                this->m_message = impl::formatDiagnostic(this->m_title, this->m_description);
            }

            [[nodiscard]] const char *what() const noexcept override {
                return this->m_message.c_str();
            }

            [[nodiscard]] const std::string &getCode() const { return this->m_code; }
            [[nodiscard]] const std::string &getTitle() const { return this->m_title; }
            [[nodiscard]] const std::string &getDescription() const { return this->m_description; }

        private:
            std::string m_code;
            std::string m_title, m_description;
            std::string m_message;
        };

        Diagnostic(char prefix, u32 errorCode, std::string title) : m_prefix(prefix), m_errorCode(errorCode), m_title(std::move(title)) {

        }

        [[nodiscard]] std::string getCode() const {
            return impl::formatDiagnosticCode(this->m_prefix, this->m_errorCode);
        }

        [[nodiscard]] const std::string &getTitle() const {
            return this->m_title;
        }

        [[nodiscard]] std::string format(const std::string &description) const {
            return impl::formatDiagnostic(this->m_title, description);
        }

        [[noreturn]] void throwError(const std::string &description) const {
            throw Exception(this->getCode(), this->m_title, description);
        }

    private:
        char m_prefix;
        u32 m_errorCode;
        std::string m_title;
    };

}
