#pragma once

#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Capability (RPC) conventions shared by every manager that advertises
// procedures on the control plane.
namespace rpc {

constexpr const char* kSuccess = "SUCCESS";
constexpr const char* kError = "ERROR";

using Handler = std::function<nlohmann::json(const nlohmann::json& args)>;

struct Capability {
    std::string verb;
    Handler handler;
};

// iotronic.<sessionID>.<boardUUID>.<Verb>
std::string procedureName(const std::string& session_id, const std::string& board_uuid, const std::string& verb);

nlohmann::json success(const std::string& message);
nlohmann::json success(const std::string& message, const nlohmann::json& data);
nlohmann::json error(const std::string& message);

// Runs body and turns any exception into an ERROR record.
nlohmann::json guard(const std::string& verb, const std::function<nlohmann::json()>& body);

// Positional argument accessors; throw InvalidArgumentError.
std::string stringArg(const nlohmann::json& args, size_t index, const std::string& name);
std::optional<std::string> optionalStringArg(const nlohmann::json& args, size_t index, const std::string& name);
int portArg(const nlohmann::json& args, size_t index, const std::string& name);

// Resource names end up in file names and URLs: [A-Za-z0-9_-]+
void validateResourceName(const std::string& name);

}
