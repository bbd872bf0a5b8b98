#include "access_gate.hpp"

#include <cctype>
#include <stdexcept>

#include "util.hpp"

namespace memkeep {

AccessGate::AccessGate(std::shared_ptr<const KeyRegistry> registry) : registry_(std::move(registry)) {
	if (!registry_) throw std::invalid_argument("AccessGate requires a registry");
}

std::optional<std::string> AccessGate::bearerToken(const std::string &authorizationHeader) {
	static const std::string kScheme = "bearer";
	if (authorizationHeader.size() <= kScheme.size()) return std::nullopt;
	for (size_t i = 0; i < kScheme.size(); i++) {
		if (std::tolower((unsigned char)authorizationHeader[i]) != kScheme[i]) return std::nullopt;
	}
	if (!std::isspace((unsigned char)authorizationHeader[kScheme.size()])) return std::nullopt;
	std::string token = trimCopy(authorizationHeader.substr(kScheme.size()));
	if (token.empty()) return std::nullopt;
	return token;
}

AccessResult AccessGate::authenticate(const std::string &authorizationHeader) const {
	AccessResult res;
	auto token = bearerToken(authorizationHeader);
	if (!token) {
		res.error = ErrorKind::Unauthenticated;
		res.message = "Missing or invalid Authorization header";
		return res;
	}
	auto tenant = registry_->validate(*token);
	if (!tenant) {
		res.error = ErrorKind::Unauthorized;
		res.message = "Unauthorized";
		return res;
	}
	res.ok = true;
	res.context = RequestContext{*tenant};
	return res;
}

} // namespace memkeep
