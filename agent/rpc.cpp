#include "rpc.h"
#include "errors.h"
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

namespace rpc {

std::string procedureName(const std::string& session_id, const std::string& board_uuid, const std::string& verb) {
    return "iotronic." + session_id + "." + board_uuid + "." + verb;
}

nlohmann::json success(const std::string& message) {
    return {{"result", kSuccess}, {"message", message}};
}

nlohmann::json success(const std::string& message, const nlohmann::json& data) {
    nlohmann::json response = success(message);
    response["data"] = data;
    return response;
}

nlohmann::json error(const std::string& message) {
    return {{"result", kError}, {"message", message}};
}

nlohmann::json guard(const std::string& verb, const std::function<nlohmann::json()>& body) {
    try {
        return body();
    } catch (const AgentError& e) {
        spdlog::warn("[RPC] {} failed: {}", verb, e.what());
        return error(e.what());
    } catch (const std::exception& e) {
        spdlog::error("[RPC] {} raised unexpected error: {}", verb, e.what());
        return error(std::string("Internal error: ") + e.what());
    }
}

namespace {

const nlohmann::json& argAt(const nlohmann::json& args, size_t index, const std::string& name) {
    if (!args.is_array() || index >= args.size()) {
        throw InvalidArgumentError("Missing argument: " + name + " required");
    }
    return args[index];
}

}

std::string stringArg(const nlohmann::json& args, size_t index, const std::string& name) {
    const nlohmann::json& value = argAt(args, index, name);
    if (!value.is_string()) {
        throw InvalidArgumentError("Invalid " + name + " type");
    }
    return value.get<std::string>();
}

std::optional<std::string> optionalStringArg(const nlohmann::json& args, size_t index, const std::string& name) {
    if (!args.is_array() || index >= args.size() || args[index].is_null()) {
        return std::nullopt;
    }
    return stringArg(args, index, name);
}

int portArg(const nlohmann::json& args, size_t index, const std::string& name) {
    const nlohmann::json& value = argAt(args, index, name);

    double number = 0;
    if (value.is_number_integer()) {
        number = static_cast<double>(value.get<int64_t>());
    } else if (value.is_number_float()) {
        number = value.get<double>();
        if (std::floor(number) != number) {
            throw InvalidArgumentError("Invalid " + name + ": not an integer");
        }
    } else {
        throw InvalidArgumentError("Invalid " + name + " type");
    }

    if (number < 1 || number > 65535) {
        throw InvalidArgumentError("Invalid " + name + ": out of range");
    }
    return static_cast<int>(number);
}

void validateResourceName(const std::string& name) {
    if (name.empty()) {
        throw InvalidArgumentError("Name must not be empty");
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            throw InvalidArgumentError("Invalid name '" + name + "': only letters, digits, '-' and '_' allowed");
        }
    }
}

}
