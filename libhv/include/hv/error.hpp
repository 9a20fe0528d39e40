#pragma once

#include <stdint.h>
#include <expected>
#include <iosfwd>

namespace hv {

enum class ErrorKind {
	overlap,
	invalidAlignment,
	resourceExhausted,
	notFound,
	unsupported,
	invalidRoute,
	incompatibleSnapshot,
	unsupportedVersion,
	backendFailure,
	loggingDisabled,
	illegalState,
	illegalArgs
};

struct Error {
	ErrorKind kind;

	// Identifier of the offending object: a slot ID, GSI, vCPU ID,
	// guest address or section index, depending on the operation.
	uint64_t subject = 0;

	// errno of the native call for ErrorKind::backendFailure.
	int nativeCode = 0;

	// Name of the failed native call or of the rejected operation.
	const char *operation = nullptr;
};

template<typename T = void>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> makeError(ErrorKind kind, uint64_t subject = 0,
		const char *operation = nullptr) {
	return std::unexpected{Error{kind, subject, 0, operation}};
}

inline std::unexpected<Error> backendFailure(const char *operation, int nativeCode,
		uint64_t subject = 0) {
	return std::unexpected{Error{ErrorKind::backendFailure, subject, nativeCode, operation}};
}

const char *errorKindName(ErrorKind kind);

std::ostream &operator<< (std::ostream &os, const Error &error);

} // namespace hv
