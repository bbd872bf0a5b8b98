#include "dispatcher.hpp"

#include <iostream>
#include <stdexcept>

#include "errors.hpp"

namespace memkeep {

json CycleStats::toJson() const {
	return json{{"tenants", tenants},
				{"categoriesFetched", categoriesFetched},
				{"descriptors", descriptors},
				{"dispatched", dispatched},
				{"failures", failures}};
}

AutomationDispatcher::AutomationDispatcher(RegistryLoader loadRegistry,
										   std::vector<std::string> categories,
										   std::chrono::milliseconds interval,
										   std::shared_ptr<MemoryClient> client,
										   std::shared_ptr<HandlerRegistry> handlers)
	: loadRegistry_(std::move(loadRegistry)),
	  categories_(std::move(categories)),
	  interval_(interval),
	  client_(std::move(client)),
	  handlers_(std::move(handlers)) {
	if (!loadRegistry_ || !client_ || !handlers_) {
		throw std::invalid_argument("AutomationDispatcher requires a registry loader, a client and handlers");
	}
}

AutomationDispatcher::~AutomationDispatcher() {
	stop();
}

std::vector<json> AutomationDispatcher::classify(const json &record) {
	std::vector<json> out;
	if (record.is_object()) {
		out.push_back(record);
	} else if (record.is_array()) {
		for (const auto &item : record) {
			if (item.is_object()) out.push_back(item);
		}
	}
	return out;
}

std::string AutomationDispatcher::moduleTypeOf(const json &descriptor) {
	if (!descriptor.is_object()) return "";
	for (const char *field : {"type", "module_type"}) {
		auto it = descriptor.find(field);
		if (it != descriptor.end() && it->is_string() && !it->get<std::string>().empty()) {
			return it->get<std::string>();
		}
	}
	return "";
}

bool AutomationDispatcher::isEmptyRecord(const json &record) {
	if (record.is_null()) return true;
	if (record.is_string()) return record.get<std::string>().empty();
	if (record.is_array() || record.is_object()) return record.empty();
	return false;
}

bool AutomationDispatcher::isDisabled(const json &descriptor) {
	auto it = descriptor.find("enabled");
	return it != descriptor.end() && it->is_boolean() && !it->get<bool>();
}

CycleStats AutomationDispatcher::runCycle() {
	CycleStats stats;
	KeyRegistry registry = loadRegistry_();
	stats.tenants = registry.size();
	if (registry.empty()) {
		std::cout << "[Dispatcher] No tenants in whitelist" << std::endl;
	}
	for (const auto &tenant : registry.tenants()) {
		try {
			processTenant(tenant, stats);
		} catch (const std::exception &e) {
			stats.failures++;
			std::cerr << "[Dispatcher] tenant failed [" << tenant.name << "] " << e.what() << std::endl;
		}
	}
	cycles_++;
	return stats;
}

void AutomationDispatcher::processTenant(const Tenant &tenant, CycleStats &stats) {
	std::cout << "[Dispatcher] Checking tenant: " << tenant.name << std::endl;
	json memories = json::object();
	bool any = false;
	for (const auto &category : categories_) {
		try {
			auto data = client_->getMemory(tenant.key, category);
			stats.categoriesFetched++;
			memories[category] = data ? *data : json();
			if (data && !isEmptyRecord(*data)) any = true;
		} catch (const std::exception &e) {
			stats.failures++;
			memories[category] = nullptr;
			std::cerr << "[Dispatcher] fetch failed [" << tenant.name << "] [" << category << "] " << e.what() << std::endl;
		}
	}
	if (!any) {
		std::cout << "[Dispatcher] No memories found for " << tenant.name << std::endl;
		return;
	}

	for (const auto &category : categories_) {
		const json &data = memories[category];
		if (isEmptyRecord(data)) continue;
		for (const auto &descriptor : classify(data)) {
			stats.descriptors++;
			dispatchDescriptor(tenant, category, descriptor, memories, stats);
		}
	}
}

void AutomationDispatcher::dispatchDescriptor(const Tenant &tenant, const std::string &category, const json &descriptor,
											  const json &memories, CycleStats &stats) {
	const std::string moduleType = moduleTypeOf(descriptor);
	if (moduleType.empty() || isDisabled(descriptor)) return;
	auto handler = handlers_->find(moduleType);
	if (!handler) return;

	HandlerContext context;
	context.category = category;
	context.allMemory = memories;
	context.client = client_.get();

	std::cout << "[Dispatcher] Running " << moduleType << " handler for " << tenant.name << " [" << category << "]" << std::endl;
	try {
		handler->handle(tenant.name, tenant.key, descriptor, context);
		stats.dispatched++;
	} catch (const std::exception &e) {
		stats.failures++;
		std::cerr << "[Dispatcher] " << errorKindName(ErrorKind::HandlerFailure) << " [" << tenant.name << "] [" << category
				  << "] [" << moduleType << "] " << e.what() << std::endl;
	} catch (...) {
		stats.failures++;
		std::cerr << "[Dispatcher] " << errorKindName(ErrorKind::HandlerFailure) << " [" << tenant.name << "] [" << category
				  << "] [" << moduleType << "] non-standard exception" << std::endl;
	}
}

void AutomationDispatcher::loop() {
	while (running_) {
		try {
			auto stats = runCycle();
			std::cout << "[Dispatcher] Cycle done: " << stats.toJson().dump() << std::endl;
		} catch (const std::exception &e) {
			std::cerr << "[Dispatcher] CRITICAL ERROR IN WORKER LOOP: " << e.what() << std::endl;
		} catch (...) {
			std::cerr << "[Dispatcher] CRITICAL ERROR IN WORKER LOOP: non-standard exception" << std::endl;
		}
		if (!running_) break;
		std::cout << "[Dispatcher] Sleeping for " << interval_.count() / 1000 << " seconds..." << std::endl;
		sleepInterval();
	}
}

void AutomationDispatcher::sleepInterval() {
	std::unique_lock<std::mutex> lock(sleepMu_);
	sleepCv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
}

void AutomationDispatcher::runForever() {
	running_ = true;
	loop();
}

void AutomationDispatcher::start() {
	if (running_.exchange(true)) return;
	worker_ = std::thread([this]() { loop(); });
}

void AutomationDispatcher::stop() {
	{
		std::lock_guard<std::mutex> lock(sleepMu_);
		running_ = false;
	}
	sleepCv_.notify_all();
	if (worker_.joinable()) worker_.join();
}

} // namespace memkeep
