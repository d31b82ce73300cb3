#ifndef COMMANDRUNNER_HPP
#define COMMANDRUNNER_HPP

#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../cache/LsCache.hpp"
#include "../interfaces/ILogger.hpp"

namespace ExitCodes {
    static constexpr int SUCCESS = 0;
    static constexpr int BAD_ARGUMENTS = 1;
    static constexpr int NOT_FOUND = 2;
}

struct Command {
    std::string op;
    std::string key;
    std::string value;
    int64_t ttl = 0;
};

// Drives an LsCache from the command line, either one operation given as
// key=value arguments or a script of whitespace-separated lines:
//   set <key> <value> [ttl] | get <key> | remove <key> | flush | supported | bucket [name]
class CommandRunner {
public:
    CommandRunner(std::shared_ptr<LsCache> cache, std::shared_ptr<ILogger> logger);

    // op=<op> key=<key> value=<value> ttl=<ttl>
    static std::optional<Command> fromArguments(const std::map<std::string, std::string>& args);
    static std::optional<Command> fromLine(const std::string& line);

    int execute(const Command& command, std::ostream& out);
    // Blank lines and lines starting with '#' are skipped. Returns
    // BAD_ARGUMENTS if any line could not be parsed, SUCCESS otherwise.
    int runScript(std::istream& in, std::ostream& out);

private:
    static bool isValid(const Command& command);

    std::shared_ptr<LsCache> cache_;
    std::shared_ptr<ILogger> logger_;
};

#endif // COMMANDRUNNER_HPP
