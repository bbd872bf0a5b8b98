#include "memory_api.hpp"

#include <iostream>
#include <stdexcept>

namespace memkeep {

MemoryApi::MemoryApi(std::shared_ptr<AccessGate> gate, std::shared_ptr<MemoryStore> store)
	: gate_(std::move(gate)), store_(std::move(store)) {
	if (!gate_ || !store_) throw std::invalid_argument("MemoryApi requires a gate and a store");
}

ApiResponse MemoryApi::error(int status, const std::string &message) {
	return ApiResponse{status, json{{"error", message}}};
}

ApiResponse MemoryApi::fromError(const MemoryError &e) {
	return error(httpStatusFor(e.kind()), e.what());
}

ApiResponse MemoryApi::logMemory(const std::string &authorization, const json &body) {
	auto access = gate_->authenticate(authorization);
	if (!access.ok) return error(httpStatusFor(access.error), access.message);
	const auto &tenant = access.context->tenant;

	if (body.is_discarded() || !body.is_object()) return error(400, "invalid json");
	std::string type = kDefaultCategory;
	if (body.contains("type") && !body["type"].is_null()) {
		if (!body["type"].is_string()) return error(400, "'type' must be a string");
		type = body["type"].get<std::string>();
	}
	auto entry = MemoryEntry::forAppend(body.value("entry", json()));
	if (!entry) return error(400, "Missing 'entry'");

	try {
		store_->append(tenant.key, type, *entry);
	} catch (const MemoryError &e) {
		return fromError(e);
	} catch (const std::exception &e) {
		std::cerr << "[MemoryApi] append failed [" << tenant.name << "] [" << type << "] " << e.what() << std::endl;
		return error(500, e.what());
	}
	return ApiResponse{200, json{{"status", "logged"}}};
}

ApiResponse MemoryApi::getMemory(const std::string &authorization, const std::string &type) {
	auto access = gate_->authenticate(authorization);
	if (!access.ok) return error(httpStatusFor(access.error), access.message);
	const auto &tenant = access.context->tenant;
	const std::string category = type.empty() ? std::string(kDefaultCategory) : type;

	try {
		auto stored = store_->read(tenant.key, category);
		if (!stored) return error(404, "No memory found");
		return ApiResponse{200, json{{"memory", stored->payload}, {"format", formatName(stored->format)}}};
	} catch (const MemoryError &e) {
		if (e.kind() == ErrorKind::StorageCorrupt) {
			std::cerr << "[MemoryApi] corrupt memory [" << tenant.name << "] [" << category << "]" << std::endl;
		}
		return fromError(e);
	} catch (const std::exception &e) {
		std::cerr << "[MemoryApi] read failed [" << tenant.name << "] [" << category << "] " << e.what() << std::endl;
		return error(500, e.what());
	}
}

ApiResponse MemoryApi::overwriteMemory(const std::string &authorization, const json &body) {
	auto access = gate_->authenticate(authorization);
	if (!access.ok) return error(httpStatusFor(access.error), access.message);
	const auto &tenant = access.context->tenant;

	if (body.is_discarded() || !body.is_object()) return error(400, "invalid json");
	const json type = body.value("type", json());
	auto entry = MemoryEntry::forOverwrite(body.value("entry", json()));
	if (!type.is_string() || type.get<std::string>().empty() || !entry) {
		return error(400, "Missing 'type' or 'entry'");
	}
	const std::string category = type.get<std::string>();

	try {
		store_->overwrite(tenant.key, category, *entry);
	} catch (const MemoryError &e) {
		return fromError(e);
	} catch (const std::exception &e) {
		std::cerr << "[MemoryApi] overwrite failed [" << tenant.name << "] [" << category << "] " << e.what() << std::endl;
		return error(500, e.what());
	}
	return ApiResponse{200, json{{"status", "overwritten"}}};
}

ApiResponse MemoryApi::health() const {
	return ApiResponse{200, json{{"ok", true}, {"tenants", gate_->registry().size()}}};
}

} // namespace memkeep
