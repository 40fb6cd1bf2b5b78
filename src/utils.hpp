#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <iostream>

enum class MailboxPolicy
{
    Drain,
    Accumulate
};

enum class LogLevel
{
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

struct SimulatorConfig
{
    std::string host = "127.0.0.1";
    int basePort = 5000;
    int portStep = 1;
    int pollIntervalMs = 100;
    int ioTimeoutMs = 1000;
    int maxRoundsPerNode = 50;
    MailboxPolicy mailboxPolicy = MailboxPolicy::Drain;
    size_t compressThreshold = 0;
    LogLevel logLevel = LogLevel::Info;
};

// Section name -> key -> value, in the [section] key=value format.
std::map<std::string, std::map<std::string, std::string>> parseIniFile(std::istream &in);

SimulatorConfig parseSimulatorConfig(std::istream &in);

// Missing file yields the defaults.
SimulatorConfig loadSimulatorConfig(const std::string &configFile);

std::vector<std::string> split(const std::string &str, char delimiter);

std::string trim(const std::string &str);

MailboxPolicy parseMailboxPolicy(const std::string &value);
LogLevel parseLogLevel(const std::string &value);

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool logEnabled(LogLevel level);

// Writes one whole line; safe to call from listener threads.
void logLine(LogLevel level, const std::string &message);

inline void logError(const std::string &message) { logLine(LogLevel::Error, message); }
inline void logWarn(const std::string &message) { logLine(LogLevel::Warn, message); }
inline void logInfo(const std::string &message) { logLine(LogLevel::Info, message); }
inline void logDebug(const std::string &message) { logLine(LogLevel::Debug, message); }

// logError(msg + ": " + strerror(errno)), the threaded counterpart of perror().
void logErrno(const std::string &message);

inline std::string toHex(const std::string &input)
{
    std::ostringstream oss;
    for (unsigned char c : input)
    {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return oss.str();
}

// Throws std::runtime_error on odd length or non-hex digits.
std::string fromHex(const std::string &hex);

std::string formatCost(double cost);
