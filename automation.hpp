#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "memory_client.hpp"
#include "util.hpp"

namespace memkeep {

struct HandlerContext {
	std::string category;
	// category -> payload fetched for this tenant in the current cycle (null if none).
	json allMemory = json::object();
	// Write-back channel; may be null.
	MemoryClient *client{nullptr};
};

class AutomationHandler {
public:
	virtual ~AutomationHandler() = default;
	virtual std::string type() const = 0;
	virtual void handle(const std::string &tenantName,
						const std::string &tenantKey,
						const json &descriptor,
						const HandlerContext &context) = 0;
};

class HandlerRegistry {
public:
	bool registerHandler(std::shared_ptr<AutomationHandler> handler, std::string *error = nullptr);
	bool removeHandler(const std::string &type, std::string *error = nullptr);
	std::shared_ptr<AutomationHandler> find(const std::string &type) const;
	json listHandlers() const;
	size_t size() const;

private:
	mutable std::mutex mu_;
	std::vector<std::shared_ptr<AutomationHandler>> handlers_;
	std::unordered_map<std::string, size_t> handlerIndex_;
};

std::shared_ptr<HandlerRegistry> createDefaultHandlers();

} // namespace memkeep
