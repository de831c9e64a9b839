#pragma once

#include <stdexcept>
#include <string>

// Base class for every failure the agent reports across component boundaries.
class AgentError : public std::runtime_error {
public:
    explicit AgentError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or inconsistent settings; fatal at startup.
class ConfigurationError : public AgentError {
public:
    explicit ConfigurationError(const std::string& message) : AgentError(message) {}
};

// A settings or registry document could not be written. The in-memory
// change that triggered the write has already been applied.
class PersistenceError : public AgentError {
public:
    explicit PersistenceError(const std::string& message) : AgentError(message) {}
};

class TransportError : public AgentError {
public:
    explicit TransportError(const std::string& message) : AgentError(message) {}
};

class NotConnectedError : public AgentError {
public:
    explicit NotConnectedError(const std::string& message) : AgentError(message) {}
};

class TimeoutError : public AgentError {
public:
    explicit TimeoutError(const std::string& message) : AgentError(message) {}
};

class AlreadyExistsError : public AgentError {
public:
    explicit AlreadyExistsError(const std::string& message) : AgentError(message) {}
};

class NotFoundError : public AgentError {
public:
    explicit NotFoundError(const std::string& message) : AgentError(message) {}
};

class InvalidArgumentError : public AgentError {
public:
    explicit InvalidArgumentError(const std::string& message) : AgentError(message) {}
};

class ProcessError : public AgentError {
public:
    explicit ProcessError(const std::string& message) : AgentError(message) {}
};
