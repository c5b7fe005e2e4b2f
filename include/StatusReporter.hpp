#pragma once
#include <iostream>
#include <string>

// Where user-facing status lines go (console, or a capture in tests).
class StatusReporter {
public:
    virtual ~StatusReporter() = default;
    virtual void info(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

class ConsoleReporter : public StatusReporter {
public:
    void info(const std::string& message) override  { std::cout << message << "\n"; }
    void error(const std::string& message) override { std::cerr << "[Error] " << message << "\n"; }
};
