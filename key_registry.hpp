#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "util.hpp"

namespace memkeep {

struct Tenant {
	std::string name;
	std::string key;
};

// Static credential whitelist. Immutable once built; reload by building a new one.
class KeyRegistry {
public:
	KeyRegistry() = default;

	// Never throws: an unreadable file gives an empty registry and a warning.
	static KeyRegistry load(const fs::path &path);
	static KeyRegistry parse(const std::string &text, const std::string &source = "<memory>");
	static KeyRegistry fromEntries(const std::vector<std::pair<std::string, std::string>> &nameKeyPairs);

	std::optional<Tenant> validate(const std::string &credential) const;
	const std::vector<Tenant> &tenants() const { return tenants_; }
	std::size_t size() const { return tenants_.size(); }
	bool empty() const { return tenants_.empty(); }

	static bool isUsableKey(const std::string &key);

private:
	void add(const std::string &name, const std::string &key, const std::string &source);

	std::vector<Tenant> tenants_;
	std::unordered_map<std::string, std::size_t> byKey_;
};

} // namespace memkeep
