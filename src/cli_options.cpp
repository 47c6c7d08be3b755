#include "cli_options.hpp"
#include "number_parse.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace geocell
{
    namespace
    {
        struct Arity
        {
            size_t min, max;
        };

        Arity arityOf(Command c)
        {
            switch (c)
            {
            case Command::Encode:
                return {2, 3};
            case Command::Adjacent:
                return {2, 2};
            case Command::Decode:
            case Command::Bounds:
            case Command::Neighbours:
                return {1, 1};
            }
            return {0, 0};
        }

        bool startsWith(const std::string &s, const std::string &prefix)
        {
            return s.rfind(prefix, 0) == 0;
        }
    } // namespace

    Command parseCommand(const std::string &s)
    {
        if (s == "encode")
            return Command::Encode;
        if (s == "decode")
            return Command::Decode;
        if (s == "bounds")
            return Command::Bounds;
        if (s == "adjacent")
            return Command::Adjacent;
        if (s == "neighbours" || s == "neighbors")
            return Command::Neighbours;
        throw std::invalid_argument("unknown command: " + s);
    }

    std::string commandName(Command c)
    {
        switch (c)
        {
        case Command::Encode:
            return "encode";
        case Command::Decode:
            return "decode";
        case Command::Bounds:
            return "bounds";
        case Command::Adjacent:
            return "adjacent";
        case Command::Neighbours:
            return "neighbours";
        }
        return "unknown";
    }

    CliOptions parseCliOptions(int argc, const char *const argv[])
    {
        // flags may appear in any position:
        //   positional: <command> <args...>
        //   flags: --log=PATH , --prefix=N
        CliOptions opts;
        std::vector<std::string> pos;

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (startsWith(a, "--log="))
            {
                opts.log_path = a.substr(6);
            }
            else if (startsWith(a, "--prefix="))
            {
                int n = text::parseInt(a.substr(9), "prefix");
                if (n < 1)
                    throw std::invalid_argument("prefix must be positive: " + a.substr(9));
                opts.prefix = n;
            }
            else if (startsWith(a, "--"))
            {
                throw std::invalid_argument("unknown option: " + a);
            }
            else
            {
                pos.push_back(a);
            }
        }

        if (pos.empty())
            throw std::invalid_argument("missing command");

        opts.command = parseCommand(pos[0]);
        opts.args.assign(pos.begin() + 1, pos.end());

        const Arity ar = arityOf(opts.command);
        if (opts.args.size() < ar.min || opts.args.size() > ar.max)
            throw std::invalid_argument("wrong number of arguments for " + pos[0]);

        return opts;
    }

    std::string applyPrefix(const std::string &geohash, const std::optional<int> &prefix)
    {
        if (!prefix || static_cast<size_t>(*prefix) >= geohash.size())
            return geohash;
        return geohash.substr(0, static_cast<size_t>(*prefix));
    }
} // namespace geocell
