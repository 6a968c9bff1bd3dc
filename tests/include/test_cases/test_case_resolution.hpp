#pragma once

#include "test_case.hpp"

#include <rr/resolver.hpp>

namespace rr::test {

    class TestCaseAbsolutePath : public TestCase {
    public:
        TestCaseAbsolutePath() : TestCase("AbsolutePath") { }

        void setup() override {
            TestCase::setup();

            this->m_file = directory().createFile("absolute/RrAbsolute.dll");
            directory().createFile("lib/RrAbsolute.dll");
        }

        [[nodiscard]] bool run() override {
            auto fileSystem = std::make_shared<CountingFileSystem>();

            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());
            resolver.setFileSystem(fileSystem);

            api::ResolutionConfig config;
            config.explicitIncludeDirectories = { directory().path() / "lib" };

            const auto result = resolver.resolve(config, { { toString(this->m_file), "" } });

            bool success = true;
            success &= check(result.size() == 1, "absolute path did not resolve");
            if (result.size() == 1)
                success &= check(result[0].path == toString(this->m_file), "absolute path was not returned verbatim");

            success &= check(fileSystem->getTotalFileProbes() == 1, "search directories were probed for an absolute path");
            success &= check(fileSystem->getFileProbes(directory().path() / "lib" / "RrAbsolute.dll") == 0, "include directory was probed");

            return success;
        }

    private:
        std::fs::path m_file;
    };

    class TestCaseSearchPath : public TestCase {
    public:
        TestCaseSearchPath() : TestCase("SearchPath") { }

        void setup() override {
            TestCase::setup();

            directory().createFile("lib/RrSearchFoo.dll");
            directory().createFile("tools/RrSearchTool.exe");
            directory().createFile("core/RrSearchCore.dll");
        }

        [[nodiscard]] bool run() override {
            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());

            api::ResolutionConfig config;
            config.explicitIncludeDirectories = { directory().path() / "lib", directory().path() / "tools" };
            config.coreLibraryDirectory = directory().path() / "core";

            const auto result = resolver.resolve(config, {
                { "RrSearchFoo.dll", "a" },
                { "RrSearchTool.exe", "b" },
                { "RrSearchCore", "c" },
                { "RrSearchFoo, Version=1.0.0.0, Culture=neutral, PublicKeyToken=null", "d" }
            });

            if (!check(result.size() == 4, fmt::format("expected 4 resolved references, got {}", result.size())))
                return false;

            bool success = true;
            success &= check(result[0].path == toString(directory().path() / "lib" / "RrSearchFoo.dll"), "file name was not found in include directory");
            success &= check(result[1].path == toString(directory().path() / "tools" / "RrSearchTool.exe"), "executable was not found in include directory");
            success &= check(result[2].path == toString(directory().path() / "core" / "RrSearchCore.dll"), "simple name did not get the default extension");
            success &= check(result[3].path == toString(directory().path() / "lib" / "RrSearchFoo.dll"), "descriptor did not resolve by its simple name");

            return success;
        }
    };

    class TestCaseUnresolvable : public TestCase {
    public:
        TestCaseUnresolvable() : TestCase("Unresolvable") { }

        [[nodiscard]] bool run() override {
            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());

            LogCapture capture;
            api::ResolutionConfig config;
            config.explicitIncludeDirectories = { directory().path() };
            capture.attach(config);

            const auto result = resolver.resolve(config, {
                { "RrMissing.dll", "tag1" },
                { "RrMissing, Version=1.0.0.0", "tag2" },
                { "RrMissing, Version=not-a-version", "tag3" },
                { "", "tag4" }
            });

            bool success = true;
            success &= check(result.empty(), "missing references produced a result");
            success &= check(capture.warnings.empty(), "missing references produced warnings");
            success &= check(capture.errors.empty(), "missing references produced errors");

            return success;
        }
    };

    class TestCaseOrderAndBaggage : public TestCase {
    public:
        TestCaseOrderAndBaggage() : TestCase("OrderAndBaggage") { }

        void setup() override {
            TestCase::setup();

            directory().createFile("lib/RrOrderFirst.dll");
            directory().createFile("lib/RrOrderSecond.dll");
        }

        [[nodiscard]] bool run() override {
            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());

            api::ResolutionConfig config;
            config.explicitIncludeDirectories = { directory().path() / "lib" };

            const auto result = resolver.resolve(config, {
                { "RrOrderSecond.dll", "second" },
                { "RrOrderMissing.dll", "missing" },
                { "RrOrderFirst.dll", "first" },
                { "RrOrderSecond.dll", "second again" }
            });

            if (!check(result.size() == 3, fmt::format("expected 3 resolved references, got {}", result.size())))
                return false;

            bool success = true;
            success &= check(result[0].baggage == "second" && result[0].path.ends_with("RrOrderSecond.dll"), "first result is out of order");
            success &= check(result[1].baggage == "first" && result[1].path.ends_with("RrOrderFirst.dll"), "second result is out of order");
            success &= check(result[2].baggage == "second again" && result[2].path.ends_with("RrOrderSecond.dll"), "duplicate reference was not resolved again");

            return success;
        }
    };

    class TestCaseFirstMatchWins : public TestCase {
    public:
        TestCaseFirstMatchWins() : TestCase("FirstMatchWins") { }

        void setup() override {
            TestCase::setup();

            directory().createDirectory("d0");
            directory().createFile("d1/RrShadowed.dll");
            directory().createFile("d2/RrShadowed.dll");
            directory().createDirectory("d3");
        }

        [[nodiscard]] bool run() override {
            auto fileSystem = std::make_shared<CountingFileSystem>();

            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());
            resolver.setFileSystem(fileSystem);

            const auto &root = directory().path();

            api::ResolutionConfig config;
            config.targetFrameworkDirectories = { root / "d0" };
            config.explicitIncludeDirectories = { root / "d1", root / "d2" };
            config.implicitIncludeDirectory = root / "d3";

            const auto result = resolver.resolve(config, { { "RrShadowed", "" } });

            if (!check(result.size() == 1, "reference did not resolve"))
                return false;

            bool success = true;
            success &= check(result[0].path == toString(root / "d1" / "RrShadowed.dll"), "a later directory won over an earlier one");
            success &= check(fileSystem->getFileProbes(root / "d0" / "RrShadowed.dll") == 1, "framework directory was not probed first");
            success &= check(fileSystem->getFileProbes(root / "d1" / "RrShadowed.dll") == 1, "matching directory was not probed once");
            success &= check(fileSystem->getFileProbes(root / "d2" / "RrShadowed.dll") == 0, "probing continued after a match");
            success &= check(fileSystem->getFileProbes(root / "d3" / "RrShadowed.dll") == 0, "probing continued after a match");

            return success;
        }
    };

    class TestCaseIdempotent : public TestCase {
    public:
        TestCaseIdempotent() : TestCase("Idempotent") { }

        void setup() override {
            TestCase::setup();

            directory().createFile("lib/RrStable.dll");
            directory().createFile("lib/RrStableOther.exe");
        }

        [[nodiscard]] bool run() override {
            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());

            api::ResolutionConfig config;
            config.explicitIncludeDirectories = { directory().path() / "lib" };

            const std::vector<api::ReferenceRequest> references = {
                { "RrStable", "1" },
                { "RrUnstable", "2" },
                { "RrStableOther.exe", "3" }
            };

            const auto first  = resolver.resolve(config, references);
            const auto second = resolver.resolve(config, references);

            if (!check(first.size() == second.size(), "repeated resolution returned a different number of results"))
                return false;

            bool success = true;
            for (size_t i = 0; i < first.size(); i++) {
                success &= check(first[i].path == second[i].path, fmt::format("path of result {} changed", i));
                success &= check(first[i].baggage == second[i].baggage, fmt::format("baggage of result {} changed", i));
            }

            return success;
        }
    };

    class TestCaseGracefulDegradation : public TestCase {
    public:
        TestCaseGracefulDegradation() : TestCase("GracefulDegradation") { }

        void setup() override {
            TestCase::setup();

            directory().createFile("lib/RrPortable.dll");
            directory().createFile("Windows/Microsoft.NET/assembly/GAC_MSIL/RrCached/v4.0_1.0.0.0__0123456789abcdef/RrCached.dll");
            directory().createDirectory("Windows/Microsoft.NET/Framework64/v4.0.30319");
        }

        [[nodiscard]] bool run() override {
            auto windows = std::make_shared<FakePlatform>();
            windows->runtimeDirectory = directory().path() / "Windows" / "Microsoft.NET" / "Framework64" / "v4.0.30319";

            api::ResolutionConfig config;
            config.explicitIncludeDirectories = { directory().path() / "lib" };

            const std::vector<api::ReferenceRequest> references = {
                { "RrPortable", "portable" },
                { "RrCached, Version=1.0.0.0, Culture=neutral, PublicKeyToken=0123456789abcdef", "cached" }
            };

            BuiltinResolver windowsResolver;
            windowsResolver.setPlatform(windows);
            const auto windowsResult = windowsResolver.resolve(config, references);

            BuiltinResolver portableResolver;
            portableResolver.setPlatform(std::make_shared<core::NullPlatform>());
            const auto portableResult = portableResolver.resolve(config, references);

            bool success = true;
            success &= check(windowsResult.size() == 2, "shared cache reference did not resolve on a Windows-like platform");
            success &= check(portableResult.size() == 1, "platform specific reference resolved without platform support");

            if (success) {
                success &= check(portableResult[0].baggage == "portable", "wrong reference survived");
                success &= check(portableResult[0].path == windowsResult[0].path, "portable reference resolved differently without platform support");
            }

            return success;
        }
    };

    class TestCaseToolTip : public TestCase {
    public:
        TestCaseToolTip() : TestCase("ToolTip") { }

        void setup() override {
            TestCase::setup();

            directory().createFile("RrToolTip.dll");
        }

        [[nodiscard]] bool run() override {
            BuiltinResolver resolver;
            resolver.setPlatform(std::make_shared<core::NullPlatform>());

            api::ResolutionConfig config;
            config.implicitIncludeDirectory = directory().path();

            const auto result = resolver.resolve(config, { { "RrToolTip.dll", "" } });
            if (!check(result.size() == 1, "reference did not resolve"))
                return false;

            if (!check(static_cast<bool>(result[0].prepareToolTip), "resolved reference has no tooltip formatter"))
                return false;

            return check(result[0].prepareToolTip("RrToolTip", "Resolved from the implicit directory") == "Resolved from the implicit directory", "tooltip did not return the default text");
        }
    };

}
