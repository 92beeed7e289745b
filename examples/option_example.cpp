/**
 * @file option_example.cpp
 * @brief Opening a file that may not exist, reported through Option
 */

#include "fallible/core/option.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace fallible::core;

Option<std::shared_ptr<std::ifstream>> OpenFile(const std::string& path) {
    auto file = std::make_shared<std::ifstream>(path);
    if (!file->is_open()) {
        return None<std::shared_ptr<std::ifstream>>();
    }
    return Some(std::move(file));
}

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "result.txt";

    const auto file = OpenFile(path);
    if (file.IsAbsent()) {
        std::cerr << "Could not find file: " << path << std::endl;
        return 1;
    }

    std::string first_line;
    std::getline(*file.Unwrap(), first_line);
    std::cout << "First line: " << first_line << std::endl;
    return 0;
}
