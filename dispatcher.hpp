#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "automation.hpp"
#include "key_registry.hpp"
#include "memory_client.hpp"

namespace memkeep {

struct CycleStats {
	size_t tenants{0};
	size_t categoriesFetched{0};
	size_t descriptors{0};
	size_t dispatched{0};
	size_t failures{0};

	json toJson() const;
};

// Polls every tenant's memories and hands module descriptors to registered
// handlers. One cycle: reload registry, fetch, classify, dispatch; then sleep.
// A failure in one category fetch, tenant or handler never stops the cycle.
class AutomationDispatcher {
public:
	using RegistryLoader = std::function<KeyRegistry()>;

	AutomationDispatcher(RegistryLoader loadRegistry,
						 std::vector<std::string> categories,
						 std::chrono::milliseconds interval,
						 std::shared_ptr<MemoryClient> client,
						 std::shared_ptr<HandlerRegistry> handlers);
	~AutomationDispatcher();

	CycleStats runCycle();

	// Blocks, cycling until stop() is called from another thread.
	void runForever();
	void start();
	void stop();
	bool running() const { return running_; }
	size_t cyclesCompleted() const { return cycles_; }

	// Object -> one descriptor, array -> its object elements, anything else -> none.
	static std::vector<json> classify(const json &record);
	// `type`, falling back to `module_type`; empty when neither is a non-empty string.
	static std::string moduleTypeOf(const json &descriptor);
	static bool isEmptyRecord(const json &record);
	static bool isDisabled(const json &descriptor);

private:
	void loop();
	void processTenant(const Tenant &tenant, CycleStats &stats);
	void dispatchDescriptor(const Tenant &tenant, const std::string &category, const json &descriptor,
							const json &memories, CycleStats &stats);
	void sleepInterval();

	RegistryLoader loadRegistry_;
	std::vector<std::string> categories_;
	std::chrono::milliseconds interval_;
	std::shared_ptr<MemoryClient> client_;
	std::shared_ptr<HandlerRegistry> handlers_;

	std::atomic<bool> running_{false};
	std::atomic<size_t> cycles_{0};
	std::mutex sleepMu_;
	std::condition_variable sleepCv_;
	std::thread worker_;
};

} // namespace memkeep
