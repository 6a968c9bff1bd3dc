#include <rr/resolver.hpp>
#include <rr/core/assembly_name.hpp>

#include <wolv/io/file.hpp>
#include <wolv/utils/string.hpp>

#include <cstdlib>
#include <iostream>

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cout << "Invalid number of arguments specified! " << argc << std::endl;
        return EXIT_FAILURE;
    }

    std::fs::path path = argv[1];

    wolv::io::File inputFile(path, wolv::io::File::Mode::Read);
    if (!inputFile.isValid()) {
        std::cout << "Failed to open file " << wolv::util::toUTF8String(path) << std::endl;
        return EXIT_FAILURE;
    }

    // Every line is one reference
    std::vector<rr::api::ReferenceRequest> references;
    for (const auto &line : wolv::util::splitString(inputFile.readString(), "\n")) {
        (void)rr::core::AssemblyName::parse(line);
        references.push_back({ line, "" });
    }

    rr::BuiltinResolver resolver;
    resolver.setPlatform(std::make_shared<rr::core::NullPlatform>());

    rr::api::ResolutionConfig config;
    config.explicitIncludeDirectories = { path.parent_path() };

    auto result = resolver.resolve(config, references);

    return result.size() <= references.size() ? EXIT_SUCCESS : EXIT_FAILURE;
}
