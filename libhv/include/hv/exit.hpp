#pragma once

#include <stdint.h>
#include <array>
#include <iosfwd>
#include <variant>
#include <vector>

#include <hv/types.hpp>

namespace hv {

namespace exits {

// The guest reads from a port; supply the data with Vcpu::completeRead().
struct IoIn {
	uint16_t port;
	uint8_t size;
	uint32_t count;
};

struct IoOut {
	uint16_t port;
	uint8_t size;
	uint32_t count;
	// size * count bytes.
	std::vector<uint8_t> data;
};

// The guest reads unbacked memory; supply the data with Vcpu::completeRead().
struct MmioRead {
	GuestAddress address;
	uint8_t size;
};

struct MmioWrite {
	GuestAddress address;
	uint8_t size;
	std::array<uint8_t, 8> data;
};

struct Hlt { };

struct Shutdown { };

struct InterruptWindowOpen { };

struct Debug {
	uint32_t exception;
	uint64_t pc;
	uint64_t dr6;
	uint64_t dr7;
};

// run() was cancelled by Vcpu::setImmediateExit() or a stop request.
struct ImmediateExit { };

// The backend refused to enter the guest.
struct FailEntry {
	uint64_t hardwareReason;
};

struct SystemEvent {
	enum class Type {
		shutdown,
		reset,
		crash
	} type;
};

struct InternalError {
	uint32_t suberror;
};

// A native exit code that this library does not know.
struct Unknown {
	uint64_t code;
};

} // namespace exits

using VcpuExit = std::variant<
	exits::IoIn,
	exits::IoOut,
	exits::MmioRead,
	exits::MmioWrite,
	exits::Hlt,
	exits::Shutdown,
	exits::InterruptWindowOpen,
	exits::Debug,
	exits::ImmediateExit,
	exits::FailEntry,
	exits::SystemEvent,
	exits::InternalError,
	exits::Unknown
>;

const char *exitName(const VcpuExit &exit);

std::ostream &operator<< (std::ostream &os, const VcpuExit &exit);

} // namespace hv
