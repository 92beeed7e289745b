/**
 * @file result_example.cpp
 * @brief Absorbing (value, error) outcomes from std::filesystem into Result
 */

#include "fallible/convert/outcome.hpp"
#include "fallible/core/failures.hpp"
#include "fallible/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>

using namespace fallible;
using core::OutcomeFailure;
using core::Result;

Result<std::string, OutcomeFailure> ReadAll(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return Result<std::string, OutcomeFailure>::Failure(
            OutcomeFailure::Io("could not open " + path.string()));
    }
    return Result<std::string, OutcomeFailure>::Success(
        std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()));
}

int main(int argc, char** argv) {
    const std::filesystem::path path = argc > 1 ? argv[1] : "result.txt";

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    const auto checked = convert::FromErrorCode(size, ec)
        .InspectErr([](const OutcomeFailure& failure) {
            std::cerr << "stat failed: " << failure.message << std::endl;
        });
    if (checked.IsFailure()) {
        return 1;
    }

    // Chaining stops at the first failure; Expect turns a failure here into a crash.
    const auto contents = ReadAll(path).Expect("could not read file");
    std::cout << path.string() << ": " << checked.Unwrap() << " bytes, "
              << contents.size() << " read" << std::endl;
    return 0;
}
