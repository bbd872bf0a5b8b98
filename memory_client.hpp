#pragma once

#include <optional>
#include <string>

#include "util.hpp"

namespace memkeep {

// Client side of the Memory API. Failures throw MemoryError(RemoteUnavailable).
class MemoryClient {
public:
	virtual ~MemoryClient() = default;

	// nullopt when the server has no memory for this category.
	virtual std::optional<json> getMemory(const std::string &key, const std::string &type) = 0;
	virtual void logMemory(const std::string &key, const std::string &type, const json &entry) = 0;
	virtual void overwriteMemory(const std::string &key, const std::string &type, const json &entry) = 0;
};

class HttpMemoryClient : public MemoryClient {
public:
	explicit HttpMemoryClient(std::string apiBase, int timeoutMs = 10000);

	std::optional<json> getMemory(const std::string &key, const std::string &type) override;
	void logMemory(const std::string &key, const std::string &type, const json &entry) override;
	void overwriteMemory(const std::string &key, const std::string &type, const json &entry) override;

	const std::string &apiBase() const { return apiBase_; }

private:
	struct HttpResult {
		long status{0};
		std::string body;
	};

	HttpResult perform(const std::string &url, const std::string &key, const std::string *postBody) const;
	void post(const std::string &path, const std::string &key, const std::string &type, const json &entry, const char *op) const;

	std::string apiBase_;
	int timeoutMs_{10000};
};

} // namespace memkeep
