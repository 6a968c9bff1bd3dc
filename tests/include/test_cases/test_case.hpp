#pragma once

#include <map>
#include <memory>
#include <string>

#include <fmt/format.h>

#include "test_cases/fixtures.hpp"

#define TEST(name) (rr::test::TestCase *)new rr::test::TestCase##name()

namespace rr::test {

    enum class Mode
    {
        Succeeding,
        Failing
    };

    class TestCase {
    public:
        explicit TestCase(const std::string &name, Mode mode = Mode::Succeeding) : m_name(name), m_mode(mode) {
            TestCase::s_tests.insert({ name, this });
        }

        virtual ~TestCase() = default;

        /**
         * @brief Creates the files the test resolves against. Runs once, before the first run()
         */
        virtual void setup() {
            this->m_directory = std::make_unique<TemporaryDirectory>(this->m_name);
        }

        /**
         * @brief Runs the checks of this test. May be called several times after a single setup()
         */
        [[nodiscard]] virtual bool run() = 0;

        [[nodiscard]] Mode getMode() const {
            return this->m_mode;
        }

        [[nodiscard]] const std::string &getName() const {
            return this->m_name;
        }

        [[nodiscard]] static auto &getTests() {
            return TestCase::s_tests;
        }

    protected:
        [[nodiscard]] TemporaryDirectory &directory() {
            return *this->m_directory;
        }

        static bool check(bool condition, const std::string &message) {
            if (!condition)
                fmt::print("Check failed: {}\n", message);

            return condition;
        }

    private:
        std::string m_name;
        Mode m_mode;
        std::unique_ptr<TemporaryDirectory> m_directory;

        static inline std::map<std::string, TestCase *> s_tests;
    };

}
