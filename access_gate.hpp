#pragma once

#include <memory>
#include <optional>
#include <string>

#include "errors.hpp"
#include "key_registry.hpp"

namespace memkeep {

// Resolved per request and handed to exactly one Memory API call.
struct RequestContext {
	Tenant tenant;
};

struct AccessResult {
	bool ok{false};
	ErrorKind error{ErrorKind::Unauthenticated};
	std::string message;
	std::optional<RequestContext> context;
};

class AccessGate {
public:
	explicit AccessGate(std::shared_ptr<const KeyRegistry> registry);

	AccessResult authenticate(const std::string &authorizationHeader) const;
	const KeyRegistry &registry() const { return *registry_; }

	static std::optional<std::string> bearerToken(const std::string &authorizationHeader);

private:
	std::shared_ptr<const KeyRegistry> registry_;
};

} // namespace memkeep
