#include "utils.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace
{
    std::atomic<int> currentLogLevel{static_cast<int>(LogLevel::Info)};
    std::mutex logMutex;

    const char *levelName(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        }
        return "INFO";
    }

    int parseInt(const std::string &key, const std::string &value)
    {
        try
        {
            size_t pos = 0;
            int result = std::stoi(value, &pos);
            if (pos != value.size())
            {
                throw std::invalid_argument(value);
            }
            return result;
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("Invalid integer for '" + key + "': " + value);
        }
    }
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);
    while (std::getline(tokenStream, token, delimiter))
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::map<std::string, std::map<std::string, std::string>> parseIniFile(std::istream &in)
{
    std::map<std::string, std::map<std::string, std::string>> sections;
    std::string currentSection;
    std::string line;

    while (std::getline(in, line))
    {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line.substr(0, 2) == "//")
            continue;

        // Section header [name]
        if (line.front() == '[' && line.back() == ']')
        {
            currentSection = trim(line.substr(1, line.size() - 2));
            sections[currentSection];
            continue;
        }

        size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos)
        {
            logWarn("Ignoring config line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, equalsPos));
        std::string value = trim(line.substr(equalsPos + 1));
        sections[currentSection][key] = value;
    }

    return sections;
}

MailboxPolicy parseMailboxPolicy(const std::string &value)
{
    if (value == "drain")
        return MailboxPolicy::Drain;
    if (value == "accumulate")
        return MailboxPolicy::Accumulate;
    throw std::runtime_error("Invalid mailbox_policy: " + value);
}

LogLevel parseLogLevel(const std::string &value)
{
    if (value == "error")
        return LogLevel::Error;
    if (value == "warn")
        return LogLevel::Warn;
    if (value == "info")
        return LogLevel::Info;
    if (value == "debug")
        return LogLevel::Debug;
    throw std::runtime_error("Invalid log_level: " + value);
}

SimulatorConfig parseSimulatorConfig(std::istream &in)
{
    SimulatorConfig config;
    auto sections = parseIniFile(in);

    auto it = sections.find("simulator");
    if (it == sections.end())
    {
        return config;
    }

    for (const auto &[key, value] : it->second)
    {
        if (key == "host")
        {
            in_addr addr{};
            if (inet_pton(AF_INET, value.c_str(), &addr) != 1)
                throw std::runtime_error("host must be a numeric IPv4 address: " + value);
            config.host = value;
        }
        else if (key == "base_port")
        {
            config.basePort = parseInt(key, value);
            if (config.basePort < 0 || config.basePort > 65535)
                throw std::runtime_error("base_port out of range: " + value);
        }
        else if (key == "port_step")
        {
            config.portStep = parseInt(key, value);
            if (config.portStep < 1)
                throw std::runtime_error("port_step must be positive: " + value);
        }
        else if (key == "poll_interval_ms")
        {
            config.pollIntervalMs = parseInt(key, value);
            if (config.pollIntervalMs < 1)
                throw std::runtime_error("poll_interval_ms must be positive: " + value);
        }
        else if (key == "io_timeout_ms")
        {
            config.ioTimeoutMs = parseInt(key, value);
            if (config.ioTimeoutMs < 1)
                throw std::runtime_error("io_timeout_ms must be positive: " + value);
        }
        else if (key == "max_rounds_per_node")
        {
            config.maxRoundsPerNode = parseInt(key, value);
            if (config.maxRoundsPerNode < 1)
                throw std::runtime_error("max_rounds_per_node must be positive: " + value);
        }
        else if (key == "mailbox_policy")
        {
            config.mailboxPolicy = parseMailboxPolicy(value);
        }
        else if (key == "compress_threshold")
        {
            int threshold = parseInt(key, value);
            if (threshold < 0)
                throw std::runtime_error("compress_threshold must not be negative: " + value);
            config.compressThreshold = static_cast<size_t>(threshold);
        }
        else if (key == "log_level")
        {
            config.logLevel = parseLogLevel(value);
        }
        else
        {
            logWarn("Unknown config key ignored: " + key);
        }
    }

    return config;
}

SimulatorConfig loadSimulatorConfig(const std::string &configFile)
{
    std::ifstream file(configFile);
    if (!file)
    {
        logInfo("Config file " + configFile + " not found, using defaults");
        return SimulatorConfig{};
    }
    return parseSimulatorConfig(file);
}

void setLogLevel(LogLevel level)
{
    currentLogLevel.store(static_cast<int>(level));
}

LogLevel getLogLevel()
{
    return static_cast<LogLevel>(currentLogLevel.load());
}

bool logEnabled(LogLevel level)
{
    return static_cast<int>(level) <= currentLogLevel.load();
}

void logLine(LogLevel level, const std::string &message)
{
    if (!logEnabled(level))
        return;

    std::lock_guard<std::mutex> lock(logMutex);
    std::ostream &out = (level <= LogLevel::Warn) ? std::cerr : std::cout;
    out << levelName(level) << " " << message << std::endl;
}

void logErrno(const std::string &message)
{
    int err = errno;
    logError(message + ": " + std::strerror(err));
}

std::string fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0)
    {
        throw std::runtime_error("Hex string has odd length");
    }

    std::string result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        unsigned int byte;
        std::istringstream iss(hex.substr(i, 2));
        if (!(iss >> std::hex >> byte) || !iss.eof())
        {
            throw std::runtime_error("Invalid hex digits: " + hex.substr(i, 2));
        }
        result.push_back(static_cast<char>(byte));
    }
    return result;
}

std::string formatCost(double cost)
{
    if (std::isinf(cost))
        return "inf";
    std::ostringstream oss;
    oss << cost;
    return oss.str();
}
