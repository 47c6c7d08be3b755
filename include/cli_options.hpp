#pragma once
#include <optional>
#include <string>
#include <vector>

namespace geocell
{
    enum class Command
    {
        Encode,
        Decode,
        Bounds,
        Adjacent,
        Neighbours
    };

    struct CliOptions
    {
        Command command{};
        std::vector<std::string> args; // positional arguments after the command
        std::string log_path;          // --log=PATH, empty when absent
        std::optional<int> prefix;     // --prefix=N
    };

    // Throws std::invalid_argument on an unknown command or flag, or the
    // wrong number of positional arguments for the command.
    Command parseCommand(const std::string &s);
    std::string commandName(Command c);
    CliOptions parseCliOptions(int argc, const char *const argv[]);

    // First `prefix` characters of geohash; unchanged when prefix is unset
    // or not shorter than the hash.
    std::string applyPrefix(const std::string &geohash, const std::optional<int> &prefix);
} // namespace geocell
