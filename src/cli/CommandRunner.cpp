#include <sstream>
#include <stdexcept>

#include "CommandRunner.hpp"
#include "../utils/Utils.hpp"

CommandRunner::CommandRunner(std::shared_ptr<LsCache> cache, std::shared_ptr<ILogger> logger)
    : cache_(cache), logger_(logger) {
    if (!cache_) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

bool CommandRunner::isValid(const Command& command) {
    if (command.op == "set") {
        return !command.key.empty() && command.ttl >= 0;
    }
    if (command.op == "get" || command.op == "remove") {
        return !command.key.empty();
    }
    return command.op == "flush" || command.op == "supported" || command.op == "bucket";
}

std::optional<Command> CommandRunner::fromArguments(const std::map<std::string, std::string>& args) {
    auto op_it = args.find("op");
    if (op_it == args.end()) {
        return std::nullopt;
    }

    Command command;
    command.op = op_it->second;
    if (auto it = args.find("key"); it != args.end()) {
        command.key = it->second;
    }
    if (auto it = args.find("value"); it != args.end()) {
        command.value = it->second;
    }
    if (auto it = args.find("bucket"); it != args.end() && command.op == "bucket") {
        command.key = it->second;
    }
    if (auto it = args.find("ttl"); it != args.end()) {
        auto ttl = Utils::stringToInt64(it->second);
        if (!ttl) {
            return std::nullopt;
        }
        command.ttl = *ttl;
    }
    if (!isValid(command)) {
        return std::nullopt;
    }
    return command;
}

std::optional<Command> CommandRunner::fromLine(const std::string& line) {
    std::istringstream tokens(line);
    std::vector<std::string> words;
    std::string word;
    while (tokens >> word) {
        words.push_back(word);
    }
    if (words.empty()) {
        return std::nullopt;
    }

    Command command;
    command.op = words[0];
    if (command.op == "set") {
        if (words.size() < 3 || words.size() > 4) {
            return std::nullopt;
        }
        command.key = words[1];
        command.value = words[2];
        if (words.size() == 4) {
            auto ttl = Utils::stringToInt64(words[3]);
            if (!ttl) {
                return std::nullopt;
            }
            command.ttl = *ttl;
        }
    } else if (command.op == "get" || command.op == "remove") {
        if (words.size() != 2) {
            return std::nullopt;
        }
        command.key = words[1];
    } else if (command.op == "bucket") {
        if (words.size() > 2) {
            return std::nullopt;
        }
        if (words.size() == 2) {
            command.key = words[1];
        }
    } else if (words.size() != 1) {
        return std::nullopt;
    }

    if (!isValid(command)) {
        return std::nullopt;
    }
    return command;
}

int CommandRunner::execute(const Command& command, std::ostream& out) {
    logger_->debug("Executing '" + command.op + "' for key '" + command.key + "'");
    if (command.op == "set") {
        cache_->set(command.key, command.value, command.ttl);
    } else if (command.op == "get") {
        auto value = cache_->get(command.key);
        if (!value) {
            return ExitCodes::NOT_FOUND;
        }
        out << *value << std::endl;
    } else if (command.op == "remove") {
        cache_->remove(command.key);
    } else if (command.op == "flush") {
        cache_->flush();
    } else if (command.op == "supported") {
        out << std::boolalpha << cache_->supported() << std::noboolalpha << std::endl;
    } else if (command.op == "bucket") {
        cache_->setBucket(command.key);
    } else {
        logger_->error("Unknown operation: " + command.op);
        return ExitCodes::BAD_ARGUMENTS;
    }
    return ExitCodes::SUCCESS;
}

int CommandRunner::runScript(std::istream& in, std::ostream& out) {
    int result = ExitCodes::SUCCESS;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        line = Utils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto command = fromLine(line);
        if (!command) {
            logger_->error("Cannot parse line " + std::to_string(line_number) + ": " + line);
            result = ExitCodes::BAD_ARGUMENTS;
            continue;
        }
        if (execute(*command, out) == ExitCodes::NOT_FOUND) {
            out << "(nil)" << std::endl;
        }
    }
    return result;
}
