#pragma once

#include <stdexcept>
#include <string>

namespace memkeep {

enum class ErrorKind {
	Unauthenticated,
	Unauthorized,
	BadRequest,
	NotFound,
	StorageCorrupt,
	RemoteUnavailable,
	HandlerFailure,
};

class MemoryError : public std::runtime_error {
public:
	MemoryError(ErrorKind kind, const std::string &message)
		: std::runtime_error(message), kind_(kind) {}

	ErrorKind kind() const { return kind_; }

private:
	ErrorKind kind_;
};

const char *errorKindName(ErrorKind kind);
int httpStatusFor(ErrorKind kind);

} // namespace memkeep
