#pragma once
#include "fallible/core/failures.hpp"
#include <charconv>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fallible::test_helpers {

using core::OutcomeFailure;

// Collaborators that report outcomes the conventional way: a value paired
// with an error that is present only on failure.

inline std::pair<int, std::optional<std::string>> ParseInt(const std::string_view text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return {0, std::string("invalid integer: ") + std::string(text)};
    }
    return {value, std::nullopt};
}

inline std::pair<int, std::error_code> ParseIntWithCode(const std::string_view text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{}) {
        return {0, std::make_error_code(ec)};
    }
    if (ptr != text.data() + text.size()) {
        return {0, std::make_error_code(std::errc::invalid_argument)};
    }
    return {value, std::error_code{}};
}

class InMemoryFileTable {
public:
    void Put(std::string path, std::string contents) {
        files_[std::move(path)] = std::move(contents);
    }

    [[nodiscard]] std::pair<std::string, const OutcomeFailure*> Read(const std::string& path) const {
        const auto it = files_.find(path);
        if (it == files_.end()) {
            return {std::string(), &not_found_};
        }
        return {it->second, nullptr};
    }

private:
    std::map<std::string, std::string> files_;
    OutcomeFailure not_found_ = OutcomeFailure::NotFound("no such file");
};

class CallCounter {
public:
    void Hit() { ++calls_; }
    [[nodiscard]] std::size_t Calls() const { return calls_; }

private:
    std::size_t calls_ = 0;
};

}  // namespace fallible::test_helpers
