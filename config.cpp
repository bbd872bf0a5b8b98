#include "config.hpp"

#include <algorithm>
#include <sstream>

namespace memkeep {

std::vector<std::string> splitList(const std::string &raw) {
	std::vector<std::string> out;
	std::istringstream ss(raw);
	std::string item;
	while (std::getline(ss, item, ',')) {
		item = trimCopy(item);
		if (item.empty()) continue;
		if (std::find(out.begin(), out.end(), item) == out.end()) out.push_back(item);
	}
	return out;
}

ServerConfig loadServerConfig(const std::map<std::string, std::string> &args) {
	ServerConfig c;
	c.host = argOrEnv(args, "host", "MEMKEEP_HOST", c.host);
	c.port = std::clamp((int)numberOr(argOrEnv(args, "port", "MEMKEEP_PORT", "5000"), 5000), 1, 65535);
	c.threads = std::max(1, (int)numberOr(argOrEnv(args, "threads", "MEMKEEP_THREADS", "1"), 1));
	c.whitelistPath = fs::absolute(argOrEnv(args, "whitelist", "MEMKEEP_WHITELIST", c.whitelistPath.string()));
	c.memoryDir = fs::absolute(argOrEnv(args, "memory-dir", "MEMKEEP_MEMORY_DIR", c.memoryDir.string()));
	return c;
}

WorkerConfig loadWorkerConfig(const std::map<std::string, std::string> &args) {
	WorkerConfig c;
	c.apiBase = argOrEnv(args, "api-base", "MEMKEEP_API_BASE", c.apiBase);
	while (!c.apiBase.empty() && c.apiBase.back() == '/') c.apiBase.pop_back();
	c.whitelistPath = fs::absolute(argOrEnv(args, "whitelist", "MEMKEEP_WHITELIST", c.whitelistPath.string()));
	auto categories = splitList(argOrEnv(args, "categories", "MEMKEEP_CATEGORIES", ""));
	if (!categories.empty()) c.categories = categories;
	c.pollIntervalSec = std::max(1, (int)numberOr(argOrEnv(args, "poll-interval", "MEMKEEP_POLL_INTERVAL_S", "60"), 60));
	c.requestTimeoutMs = std::max(100, (int)numberOr(argOrEnv(args, "timeout-ms", "MEMKEEP_TIMEOUT_MS", "10000"), 10000));
	c.once = boolFrom(argOrEnv(args, "once", "MEMKEEP_ONCE", "false"), false);
	return c;
}

} // namespace memkeep
