#pragma once

#include <map>
#include <string>
#include <vector>

#include "util.hpp"

namespace memkeep {

struct ServerConfig {
	std::string host{"0.0.0.0"};
	int port{5000};
	int threads{1};
	fs::path whitelistPath{"whitelist.txt"};
	fs::path memoryDir{"memory_data"};
};

struct WorkerConfig {
	std::string apiBase{"http://127.0.0.1:5000/api"};
	fs::path whitelistPath{"whitelist.txt"};
	std::vector<std::string> categories{"core", "notebook", "experience", "job"};
	int pollIntervalSec{60};
	int requestTimeoutMs{10000};
	bool once{false};
};

// --flag=value wins over the environment variable, which wins over the default.
ServerConfig loadServerConfig(const std::map<std::string, std::string> &args);
WorkerConfig loadWorkerConfig(const std::map<std::string, std::string> &args);

std::vector<std::string> splitList(const std::string &raw);

} // namespace memkeep
