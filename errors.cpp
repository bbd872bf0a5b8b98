#include "errors.hpp"

namespace memkeep {

const char *errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::Unauthenticated: return "unauthenticated";
	case ErrorKind::Unauthorized: return "unauthorized";
	case ErrorKind::BadRequest: return "bad-request";
	case ErrorKind::NotFound: return "not-found";
	case ErrorKind::StorageCorrupt: return "storage-corrupt";
	case ErrorKind::RemoteUnavailable: return "remote-unavailable";
	case ErrorKind::HandlerFailure: return "handler-failure";
	}
	return "unknown";
}

int httpStatusFor(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::Unauthenticated: return 401;
	case ErrorKind::Unauthorized: return 403;
	case ErrorKind::BadRequest: return 400;
	case ErrorKind::NotFound: return 404;
	case ErrorKind::RemoteUnavailable: return 502;
	case ErrorKind::StorageCorrupt:
	case ErrorKind::HandlerFailure:
		return 500;
	}
	return 500;
}

} // namespace memkeep
