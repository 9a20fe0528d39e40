#pragma once

#include <stdint.h>
#include <functional>
#include <optional>
#include <span>
#include <variant>

#include <hv/error.hpp>
#include <hv/registers.hpp>
#include <hv/types.hpp>
#include <hv/vcpu.hpp>

// Software reference backend. Instead of executing guest instructions, each
// vCPU runs a host-side guest program that is stepped by Vcpu::run(); every
// step returns the action the "guest" performs next.

namespace hv::sim {

struct GuestContext {
	virtual VcpuId id() const = 0;

	virtual GeneralRegs &regs() = 0;
	virtual SpecialRegs &sregs() = 0;

	// Accesses guest physical memory through the installed slots.
	// Writes to dirty-logged slots are recorded; writes to read-only slots
	// and accesses outside any slot fail with notFound.
	virtual Result<> readMemory(GuestAddress address, std::span<uint8_t> buffer) = 0;
	virtual Result<> writeMemory(GuestAddress address, std::span<const uint8_t> data) = 0;

	// Takes the highest pending interrupt vector if RFLAGS.IF is set.
	virtual std::optional<uint8_t> acknowledgeInterrupt() = 0;

	// Data that completed the most recent PortIn or MmioRead action.
	virtual std::span<const uint8_t> readResult() const = 0;

protected:
	~GuestContext() = default;
};

namespace actions {

struct PortOut {
	uint16_t port;
	uint8_t size;
	uint64_t value;
};

// The completed data also lands in the low bytes of RAX.
struct PortIn {
	uint16_t port;
	uint8_t size;
};

struct MmioRead {
	GuestAddress address;
	uint8_t size;
};

struct MmioWrite {
	GuestAddress address;
	uint8_t size;
	uint64_t value;
};

// Exits to the caller.
struct Halt { };

// Idles inside run() until an interrupt is pending (HLT with an
// in-kernel interrupt controller).
struct WaitForInterrupt { };

struct Shutdown { };

struct Breakpoint { };

// The step did not trap; keep running.
struct Continue { };

// Exits with a native exit code, decoded like any other native exit.
struct RawExit {
	uint32_t code;
};

struct Fault {
	uint32_t suberror;
};

} // namespace actions

using GuestAction = std::variant<
	actions::PortOut,
	actions::PortIn,
	actions::MmioRead,
	actions::MmioWrite,
	actions::Halt,
	actions::WaitForInterrupt,
	actions::Shutdown,
	actions::Breakpoint,
	actions::Continue,
	actions::RawExit,
	actions::Fault
>;

using GuestProgram = std::function<GuestAction(GuestContext &)>;

// Fails with unsupported if vcpu does not belong to the sim backend and with
// illegalState while it is running.
Result<> loadGuestProgram(Vcpu &vcpu, GuestProgram program);

} // namespace hv::sim
