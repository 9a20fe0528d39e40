#include <string.h>
#include <ostream>

#include <hv/error.hpp>

namespace hv {

const char *errorKindName(ErrorKind kind) {
	switch(kind) {
	case ErrorKind::overlap: return "overlap";
	case ErrorKind::invalidAlignment: return "invalid alignment";
	case ErrorKind::resourceExhausted: return "resource exhausted";
	case ErrorKind::notFound: return "not found";
	case ErrorKind::unsupported: return "unsupported";
	case ErrorKind::invalidRoute: return "invalid route";
	case ErrorKind::incompatibleSnapshot: return "incompatible snapshot";
	case ErrorKind::unsupportedVersion: return "unsupported version";
	case ErrorKind::backendFailure: return "backend failure";
	case ErrorKind::loggingDisabled: return "logging disabled";
	case ErrorKind::illegalState: return "illegal state";
	case ErrorKind::illegalArgs: return "illegal arguments";
	}
	return "unknown error";
}

std::ostream &operator<< (std::ostream &os, const Error &error) {
	os << errorKindName(error.kind);
	if(error.operation)
		os << " in " << error.operation;
	os << " (subject 0x" << std::hex << error.subject << std::dec << ")";
	if(error.kind == ErrorKind::backendFailure)
		os << ": " << strerror(error.nativeCode);
	return os;
}

} // namespace hv
