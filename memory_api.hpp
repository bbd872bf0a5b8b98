#pragma once

#include <memory>
#include <string>

#include "access_gate.hpp"
#include "memory_store.hpp"
#include "util.hpp"

namespace memkeep {

struct ApiResponse {
	int status{200};
	json body = json::object();
};

// The memory operations, independent of the HTTP framework. A discarded
// json body means the request body could not be parsed.
class MemoryApi {
public:
	static constexpr const char *kDefaultCategory = "experience";

	MemoryApi(std::shared_ptr<AccessGate> gate, std::shared_ptr<MemoryStore> store);

	ApiResponse logMemory(const std::string &authorization, const json &body);
	ApiResponse getMemory(const std::string &authorization, const std::string &type);
	ApiResponse overwriteMemory(const std::string &authorization, const json &body);
	// Liveness; needs no credential.
	ApiResponse health() const;

private:
	static ApiResponse error(int status, const std::string &message);
	static ApiResponse fromError(const MemoryError &e);

	std::shared_ptr<AccessGate> gate_;
	std::shared_ptr<MemoryStore> store_;
};

} // namespace memkeep
