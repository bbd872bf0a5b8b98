#pragma once

#include <filesystem>
#include <map>
#include <string>

#include <json/json.h>
#include <nlohmann/json.hpp>

namespace memkeep {

using json = nlohmann::json;
namespace fs = std::filesystem;

// Conversion between drogon's jsoncpp values and the nlohmann model used internally.
json fromJsoncpp(const Json::Value &v);
Json::Value toJsoncpp(const json &v);

std::string getEnv(const std::string &key, const std::string &fallback = "");
bool boolFrom(const std::string &value, bool fallback = true);
std::string trimCopy(const std::string &s);
double numberOr(const std::string &s, double fallback);

std::map<std::string, std::string> parseArgs(int argc, char **argv);
std::string argOrEnv(const std::map<std::string, std::string> &args,
					 const std::string &argKey,
					 const std::string &env,
					 const std::string &def = "");

// UTC, microsecond precision: 2026-10-19T08:15:42.123456Z
std::string nowIso();

void ensureDir(const fs::path &dir);
std::string readTextFile(const fs::path &file);

// Replaces file content through a sibling temp file and a rename.
void writeFileReplace(const fs::path &file, const std::string &content);

} // namespace memkeep
