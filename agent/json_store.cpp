#include "json_store.h"
#include "errors.h"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + path);
    }

    try {
        nlohmann::json document;
        file >> document;
        return document;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Cannot parse " + path + ": " + e.what());
    }
}

void writeJsonFile(const std::string& path, const nlohmann::json& document) {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw PersistenceError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("Cannot create " + temp_path);
        }
        file << document.dump(2);
        file.flush();
        if (!file) {
            throw PersistenceError("Cannot write " + temp_path);
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_path, ec);
        throw PersistenceError("Cannot replace " + path + ": " + reason);
    }
}
