#include "key_registry.hpp"

#include "test_support.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

using memkeep::KeyRegistry;
using memkeep::tests::Log;
using memkeep::tests::Require;

namespace {

void ScenarioParseFormats() {
	Log("scenario: named, bare, comments and blank lines");
	auto reg = KeyRegistry::parse(
		"# whitelist\n"
		"\n"
		"alpha, key-alpha\n"
		"   key-bare   \n"
		"beta ,key-beta, with comma\n"
		"  # indented comment\n");
	Require(reg.size() == 3, "expected three tenants");
	Require(reg.tenants()[0].name == "alpha" && reg.tenants()[0].key == "key-alpha", "named entry mismatch");
	Require(reg.tenants()[1].name == "key-bare" && reg.tenants()[1].key == "key-bare", "bare entry should use key as name");
	Require(reg.tenants()[2].name == "beta" && reg.tenants()[2].key == "key-beta, with comma",
			"only the first comma separates name and key");
}

void ScenarioValidate() {
	Log("scenario: validate");
	auto reg = KeyRegistry::fromEntries({{"alpha", "k1"}, {"beta", "k2"}});
	auto hit = reg.validate("k2");
	Require(hit.has_value() && hit->name == "beta", "known key should resolve to its tenant");
	Require(!reg.validate("k3").has_value(), "unknown key must not resolve");
	Require(!reg.validate("").has_value(), "empty key must not resolve");
	Require(!reg.validate("alpha").has_value(), "display names are not credentials");
}

void ScenarioDuplicatesCollapse() {
	Log("scenario: duplicate credentials collapse");
	auto reg = KeyRegistry::parse("first, shared\nsecond, shared\nshared\n");
	Require(reg.size() == 1, "duplicate credentials should collapse to one tenant");
	Require(reg.validate("shared")->name == "first", "first name should win");
}

void ScenarioUnusableKeysSkipped() {
	Log("scenario: unusable keys skipped");
	auto reg = KeyRegistry::parse("evil, ../other\nslash, a/b\ndots, ..\nempty,\nok, good\n");
	Require(reg.size() == 1, "only the usable key should load");
	Require(reg.validate("good").has_value(), "usable key should be present");
	Require(!KeyRegistry::isUsableKey("a\\b"), "backslash key must be unusable");
}

void ScenarioMissingFile() {
	Log("scenario: unreadable file gives empty registry");
	memkeep::tests::ScopedDir dir("registry");
	auto reg = KeyRegistry::load(dir.path() / "missing.txt");
	Require(reg.empty(), "missing whitelist must load as empty");
	Require(!reg.validate("anything").has_value(), "empty registry rejects everything");
}

void ScenarioLoadFromFile() {
	Log("scenario: load from file");
	memkeep::tests::ScopedDir dir("registry");
	const auto file = dir.path() / "whitelist.txt";
	{
		std::ofstream out(file);
		out << "bot-one, 111\r\n222\r\n";
	}
	auto reg = KeyRegistry::load(file);
	Require(reg.size() == 2, "file should yield two tenants");
	Require(reg.validate("111")->name == "bot-one", "CRLF lines should be trimmed");
	Require(reg.validate("222").has_value(), "bare key from file should load");
}

} // namespace

int main() {
	try {
		Log("key_registry_test: start");
		ScenarioParseFormats();
		ScenarioValidate();
		ScenarioDuplicatesCollapse();
		ScenarioUnusableKeysSkipped();
		ScenarioMissingFile();
		ScenarioLoadFromFile();
		Log("key_registry_test: finished");
		return EXIT_SUCCESS;
	} catch (const std::exception &ex) {
		memkeep::tests::LogError(ex.what());
		return EXIT_FAILURE;
	}
}
