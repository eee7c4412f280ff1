#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include <filesystem>
namespace fs = std::filesystem;

namespace eighty {

class routine_error : public std::exception
{
public:
    explicit routine_error(std::string m = "Routine precondition failed")
        : msg(std::move(m))
    {}
    const char* what() const noexcept override { return msg.c_str(); }

private:
    std::string msg;
};

class machine_error : public std::exception
{
public:
    explicit machine_error(std::string m = "Machine error") : msg(std::move(m))
    {}
    const char* what() const noexcept override { return msg.c_str(); }

private:
    std::string msg;
};

// Parse "0x1f", "1fh", "$1f" or decimal. Returns nothing on garbage.
std::optional<uint32_t> parseNumber(std::string_view text);

} // namespace eighty
