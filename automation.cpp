#include "automation.hpp"

#include <iostream>

namespace memkeep {

namespace {

class EmailMonitorHandler : public AutomationHandler {
public:
	std::string type() const override { return "email-monitor"; }
	void handle(const std::string &tenantName, const std::string &, const json &descriptor, const HandlerContext &context) override {
		std::cout << "[" << tenantName << "] [EmailMonitor] [" << context.category << "] Config: " << descriptor.dump() << std::endl;
	}
};

class ScheduledMessageHandler : public AutomationHandler {
public:
	std::string type() const override { return "scheduled-message"; }
	void handle(const std::string &tenantName, const std::string &, const json &descriptor, const HandlerContext &context) override {
		std::cout << "[" << tenantName << "] [ScheduledMessage] [" << context.category << "] Config: " << descriptor.dump() << std::endl;
	}
};

} // namespace

bool HandlerRegistry::registerHandler(std::shared_ptr<AutomationHandler> handler, std::string *error) {
	if (!handler) {
		if (error) *error = "handler is null";
		return false;
	}
	std::string key = handler->type();
	if (key.empty()) {
		if (error) *error = "handler type required";
		return false;
	}
	std::lock_guard<std::mutex> lock(mu_);
	if (handlerIndex_.count(key)) {
		if (error) *error = "handler already registered: " + key;
		return false;
	}
	handlerIndex_[key] = handlers_.size();
	handlers_.push_back(std::move(handler));
	return true;
}

bool HandlerRegistry::removeHandler(const std::string &type, std::string *error) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = handlerIndex_.find(type);
	if (it == handlerIndex_.end()) {
		if (error) *error = "handler not found";
		return false;
	}
	handlers_.erase(handlers_.begin() + (std::ptrdiff_t)it->second);
	handlerIndex_.clear();
	for (size_t i = 0; i < handlers_.size(); i++) handlerIndex_[handlers_[i]->type()] = i;
	return true;
}

std::shared_ptr<AutomationHandler> HandlerRegistry::find(const std::string &type) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = handlerIndex_.find(type);
	if (it == handlerIndex_.end()) return nullptr;
	return handlers_[it->second];
}

json HandlerRegistry::listHandlers() const {
	std::lock_guard<std::mutex> lock(mu_);
	json out = json::array();
	for (const auto &h : handlers_) out.push_back(h->type());
	return out;
}

size_t HandlerRegistry::size() const {
	std::lock_guard<std::mutex> lock(mu_);
	return handlers_.size();
}

std::shared_ptr<HandlerRegistry> createDefaultHandlers() {
	auto registry = std::make_shared<HandlerRegistry>();
	std::vector<std::shared_ptr<AutomationHandler>> builtins = {
		std::make_shared<EmailMonitorHandler>(),
		std::make_shared<ScheduledMessageHandler>(),
	};
	for (auto &handler : builtins) {
		std::string error;
		if (!registry->registerHandler(handler, &error)) {
			std::cerr << "[HandlerRegistry] " << error << std::endl;
		}
	}
	return registry;
}

} // namespace memkeep
