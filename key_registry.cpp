#include "key_registry.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace memkeep {

KeyRegistry KeyRegistry::load(const fs::path &path) {
	std::ifstream in(path);
	if (!in) {
		std::cerr << "[KeyRegistry] Warning: could not load " << path.string() << ", all requests will be rejected" << std::endl;
		return KeyRegistry();
	}
	std::ostringstream ss;
	ss << in.rdbuf();
	return parse(ss.str(), path.string());
}

KeyRegistry KeyRegistry::parse(const std::string &text, const std::string &source) {
	KeyRegistry reg;
	std::istringstream lines(text);
	std::string line;
	while (std::getline(lines, line)) {
		line = trimCopy(line);
		if (line.empty() || line[0] == '#') continue;
		auto comma = line.find(',');
		if (comma == std::string::npos) {
			reg.add(line, line, source);
		} else {
			reg.add(trimCopy(line.substr(0, comma)), trimCopy(line.substr(comma + 1)), source);
		}
	}
	return reg;
}

KeyRegistry KeyRegistry::fromEntries(const std::vector<std::pair<std::string, std::string>> &nameKeyPairs) {
	KeyRegistry reg;
	for (const auto &kv : nameKeyPairs) reg.add(kv.first, kv.second, "<entries>");
	return reg;
}

std::optional<Tenant> KeyRegistry::validate(const std::string &credential) const {
	auto it = byKey_.find(credential);
	if (it == byKey_.end()) return std::nullopt;
	return tenants_[it->second];
}

bool KeyRegistry::isUsableKey(const std::string &key) {
	if (key.empty() || key == "." || key == "..") return false;
	return key.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

void KeyRegistry::add(const std::string &name, const std::string &key, const std::string &source) {
	if (!isUsableKey(key)) {
		std::cerr << "[KeyRegistry] Skipping unusable key in " << source << (name.empty() ? "" : " for " + name) << std::endl;
		return;
	}
	if (byKey_.count(key)) {
		std::cerr << "[KeyRegistry] Duplicate key for " << (name.empty() ? key : name) << " in " << source
				  << ", keeping " << tenants_[byKey_[key]].name << std::endl;
		return;
	}
	byKey_[key] = tenants_.size();
	tenants_.push_back(Tenant{name.empty() ? key : name, key});
}

} // namespace memkeep
