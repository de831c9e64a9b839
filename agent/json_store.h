#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Reads a whole JSON document. Throws PersistenceError when the file cannot
// be opened or parsed.
nlohmann::json readJsonFile(const std::string& path);

// Rewrites a whole JSON document atomically (temporary file + rename).
// Throws PersistenceError on any I/O failure.
void writeJsonFile(const std::string& path, const nlohmann::json& document);
