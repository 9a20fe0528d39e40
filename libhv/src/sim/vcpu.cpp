#include <string.h>
#include <iostream>

#include "sim.hpp"

namespace hv::sim {

namespace {

constexpr bool logExits = false;

// Matches KVM_INTERNAL_ERROR_EMULATION.
constexpr uint32_t suberrorBadAccess = 1;

constexpr uint8_t opaqueWindowRequested = 1 << 0;
constexpr uint8_t opaqueDebugging = 1 << 1;
constexpr uint8_t opaqueHalted = 1 << 2;
constexpr uint8_t opaqueNmiPending = 1 << 3;
constexpr size_t opaqueSize = 1 + 256 / 8;

bool validPortSize(uint8_t size) {
	return size == 1 || size == 2 || size == 4;
}

bool validMmioSize(uint8_t size) {
	return size == 1 || size == 2 || size == 4 || size == 8;
}

} // anonymous namespace

Result<> loadGuestProgram(Vcpu &vcpu, GuestProgram program) {
	auto simVcpu = dynamic_cast<SimVcpu *>(&vcpu);
	if(!simVcpu)
		return makeError(ErrorKind::unsupported, vcpu.id(), "loadGuestProgram");
	if(vcpu.state() == RunState::running)
		return makeError(ErrorKind::illegalState, vcpu.id(), "loadGuestProgram");
	simVcpu->loadProgram(std::move(program));
	return {};
}

SimVcpu::SimVcpu(SimVm *vm, VcpuId id)
: vm_{vm}, id_{id}, tracker_{id}, sregs_{resetSpecialRegs()} {
	regs_.rip = 0xFFF0;
	regs_.rflags = kRflagsReserved;
	fpu_.fcw = 0x37F;
	fpu_.mxcsr = 0x1F80;
	tracker_.markRunnable();
}

SimVcpu::~SimVcpu() {
	vm_->detachVcpu(id_);
}

void SimVcpu::loadProgram(GuestProgram program) {
	program_ = std::move(program);
}

void SimVcpu::raise(uint8_t vector) {
	std::lock_guard lock{irqMutex_};
	pending_.set(vector);
	wake_.notify_all();
}

// ----------------------------------------------------------------------------
// Execution.
// ----------------------------------------------------------------------------

Result<VcpuExit> SimVcpu::run() {
	if(auto outcome = tracker_.enterRun(); !outcome)
		return std::unexpected{outcome.error()};

	if(pendingRead_ != PendingRead::none) {
		tracker_.leaveRun(false);
		return makeError(ErrorKind::illegalState, id_, "run");
	}

	auto exit = step();
	tracker_.leaveRun(true);
	if(logExits)
		std::cout << "hv/sim: vCPU " << id_ << " exits with " << exit << std::endl;
	return exit;
}

VcpuExit SimVcpu::step() {
	if(!program_)
		return exits::FailEntry{0};

	while(true) {
		if(immediateExit_.load(std::memory_order_acquire))
			return exits::ImmediateExit{};

		if(windowRequested_ && interruptsEnabled()) {
			windowRequested_ = false;
			return exits::InterruptWindowOpen{};
		}

		if(halted_) {
			if(!waitForInterrupt())
				return exits::ImmediateExit{};
			halted_ = false;
		}

		auto action = program_(*this);

		if(auto out = std::get_if<actions::PortOut>(&action)) {
			if(!validPortSize(out->size))
				return exits::InternalError{suberrorBadAccess};
			if(!vm_->signalIoEvent(IoEventAddress::Space::pio, out->port, out->size, out->value)) {
				exits::IoOut exit{out->port, out->size, 1, {}};
				exit.data.resize(out->size);
				for(size_t i = 0; i < out->size; ++i)
					exit.data[i] = (out->value >> (i * 8)) & 0xFF;
				return exit;
			}
		}else if(auto in = std::get_if<actions::PortIn>(&action)) {
			if(!validPortSize(in->size))
				return exits::InternalError{suberrorBadAccess};
			pendingRead_ = PendingRead::port;
			pendingSize_ = in->size;
			return exits::IoIn{in->port, in->size, 1};
		}else if(auto read = std::get_if<actions::MmioRead>(&action)) {
			if(!validMmioSize(read->size))
				return exits::InternalError{suberrorBadAccess};
			readResult_.resize(read->size);
			if(!vm_->readMemory(read->address, readResult_)) {
				pendingRead_ = PendingRead::mmio;
				pendingSize_ = read->size;
				return exits::MmioRead{read->address, read->size};
			}
		}else if(auto write = std::get_if<actions::MmioWrite>(&action)) {
			if(!validMmioSize(write->size))
				return exits::InternalError{suberrorBadAccess};
			exits::MmioWrite exit{write->address, write->size, {}};
			for(size_t i = 0; i < write->size; ++i)
				exit.data[i] = (write->value >> (i * 8)) & 0xFF;
			auto data = std::span<const uint8_t>{exit.data.data(), write->size};
			// Writes to read-only slots exit like writes to unbacked memory.
			if(!vm_->writeMemory(write->address, data)
					&& !vm_->signalIoEvent(IoEventAddress::Space::mmio, write->address,
							write->size, write->value))
				return exit;
		}else if(std::holds_alternative<actions::Halt>(action)) {
			return decodeNativeExit(nativeExitHlt);
		}else if(std::holds_alternative<actions::WaitForInterrupt>(action)) {
			halted_ = true;
			continue;
		}else if(std::holds_alternative<actions::Shutdown>(action)) {
			return decodeNativeExit(nativeExitShutdown);
		}else if(std::holds_alternative<actions::Breakpoint>(action)) {
			if(debugging_)
				return debugExit(3);
		}else if(auto raw = std::get_if<actions::RawExit>(&action)) {
			return decodeNativeExit(raw->code);
		}else if(auto fault = std::get_if<actions::Fault>(&action)) {
			return exits::InternalError{fault->suberror};
		}

		// The step completed inside the guest.
		if(debugging_)
			return debugExit(1);
	}
}

bool SimVcpu::waitForInterrupt() {
	std::unique_lock lock{irqMutex_};
	// Latched vectors do not wake a guest that idles with interrupts masked.
	wake_.wait(lock, [&] {
		return (pending_.any() && interruptsEnabled()) || nmiPending_
				|| immediateExit_.load(std::memory_order_acquire);
	});
	return !immediateExit_.load(std::memory_order_acquire);
}

exits::Debug SimVcpu::debugExit(uint32_t exception) const {
	uint64_t dr6 = 0xFFFF0FF0;
	if(exception == 1)
		dr6 |= 1 << 14;
	return exits::Debug{exception, regs_.rip, dr6, 0x400};
}

Result<> SimVcpu::completeRead(std::span<const uint8_t> data) {
	if(auto outcome = tracker_.checkNotRunning("completeRead"); !outcome)
		return outcome;
	if(pendingRead_ == PendingRead::none)
		return makeError(ErrorKind::illegalState, id_, "completeRead");
	if(data.size() != pendingSize_)
		return makeError(ErrorKind::illegalArgs, data.size(), "completeRead");

	readResult_.assign(data.begin(), data.end());
	if(pendingRead_ == PendingRead::port) {
		uint64_t value = 0;
		for(size_t i = 0; i < data.size(); ++i)
			value |= uint64_t{data[i]} << (i * 8);
		// 32-bit writes zero-extend; narrower ones merge into RAX.
		if(data.size() == 4) {
			regs_.rax = value;
		}else{
			uint64_t mask = (uint64_t{1} << (data.size() * 8)) - 1;
			regs_.rax = (regs_.rax & ~mask) | value;
		}
	}
	pendingRead_ = PendingRead::none;
	return {};
}

// ----------------------------------------------------------------------------
// Registers.
// ----------------------------------------------------------------------------

Result<GeneralRegs> SimVcpu::getRegs() {
	if(auto outcome = tracker_.checkNotRunning("getRegs"); !outcome)
		return std::unexpected{outcome.error()};
	return regs_;
}

Result<> SimVcpu::setRegs(const GeneralRegs &regs) {
	if(auto outcome = tracker_.checkNotRunning("setRegs"); !outcome)
		return outcome;
	regs_ = regs;
	return {};
}

Result<SpecialRegs> SimVcpu::getSregs() {
	if(auto outcome = tracker_.checkNotRunning("getSregs"); !outcome)
		return std::unexpected{outcome.error()};

	SpecialRegs sregs = sregs_;
	std::lock_guard lock{irqMutex_};
	for(size_t i = 0; i < 256; ++i) {
		if(pending_.test(i))
			sregs.interruptBitmap[i / 64] |= uint64_t{1} << (i % 64);
		else
			sregs.interruptBitmap[i / 64] &= ~(uint64_t{1} << (i % 64));
	}
	return sregs;
}

Result<> SimVcpu::setSregs(const SpecialRegs &sregs) {
	if(auto outcome = tracker_.checkNotRunning("setSregs"); !outcome)
		return outcome;

	sregs_ = sregs;
	std::lock_guard lock{irqMutex_};
	for(size_t i = 0; i < 256; ++i)
		pending_[i] = sregs.interruptBitmap[i / 64] & (uint64_t{1} << (i % 64));
	return {};
}

Result<FpuRegs> SimVcpu::getFpu() {
	if(auto outcome = tracker_.checkNotRunning("getFpu"); !outcome)
		return std::unexpected{outcome.error()};
	return fpu_;
}

Result<> SimVcpu::setFpu(const FpuRegs &fpu) {
	if(auto outcome = tracker_.checkNotRunning("setFpu"); !outcome)
		return outcome;
	fpu_ = fpu;
	return {};
}

Result<DebugRegs> SimVcpu::getDebugRegs() {
	return makeError(ErrorKind::unsupported, id_, "getDebugRegs");
}

Result<> SimVcpu::setDebugRegs(const DebugRegs &) {
	return makeError(ErrorKind::unsupported, id_, "setDebugRegs");
}

// ----------------------------------------------------------------------------
// Interrupts and cancellation.
// ----------------------------------------------------------------------------

Result<> SimVcpu::requestInterruptWindow() {
	if(auto outcome = tracker_.checkNotRunning("requestInterruptWindow"); !outcome)
		return outcome;
	windowRequested_ = true;
	return {};
}

bool SimVcpu::readyForInterrupt() {
	return interruptsEnabled() && pendingRead_ == PendingRead::none;
}

Result<> SimVcpu::injectNmi() {
	std::lock_guard lock{irqMutex_};
	nmiPending_ = true;
	wake_.notify_all();
	return {};
}

std::optional<uint8_t> SimVcpu::acknowledgeInterrupt() {
	std::lock_guard lock{irqMutex_};
	if(nmiPending_) {
		nmiPending_ = false;
		return nmiVector;
	}
	if(!interruptsEnabled())
		return std::nullopt;
	for(int vector = 255; vector >= 0; --vector) {
		if(pending_.test(vector)) {
			pending_.reset(vector);
			return vector;
		}
	}
	return std::nullopt;
}

void SimVcpu::setImmediateExit(bool exit) {
	immediateExit_.store(exit, std::memory_order_release);
	if(exit) {
		std::lock_guard lock{irqMutex_};
		wake_.notify_all();
	}
}

void SimVcpu::requestStop() {
	tracker_.requestStop();
	setImmediateExit(true);
}

Result<> SimVcpu::debugAttach() {
	if(auto outcome = tracker_.checkNotRunning("debugAttach"); !outcome)
		return outcome;
	debugging_ = true;
	return {};
}

Result<> SimVcpu::debugDetach() {
	if(auto outcome = tracker_.checkNotRunning("debugDetach"); !outcome)
		return outcome;
	debugging_ = false;
	return {};
}

// ----------------------------------------------------------------------------
// Guest memory.
// ----------------------------------------------------------------------------

Result<> SimVcpu::readMemory(GuestAddress address, std::span<uint8_t> buffer) {
	return vm_->readMemory(address, buffer);
}

Result<> SimVcpu::writeMemory(GuestAddress address, std::span<const uint8_t> data) {
	return vm_->writeMemory(address, data);
}

// ----------------------------------------------------------------------------
// Snapshot.
// ----------------------------------------------------------------------------

Result<VcpuSnapshot> SimVcpu::snapshot() {
	if(auto outcome = tracker_.checkNotRunning("snapshot"); !outcome)
		return std::unexpected{outcome.error()};

	VcpuSnapshot snapshot;
	snapshot.id = id_;
	snapshot.regs = regs_;
	snapshot.sregs = *getSregs();
	snapshot.fpu = fpu_;

	auto &state = snapshot.backendState;
	state.backend = HypervisorKind::sim;
	state.version = vcpuStateVersion;
	state.data.resize(opaqueSize);

	std::lock_guard lock{irqMutex_};
	uint8_t flags = 0;
	if(windowRequested_)
		flags |= opaqueWindowRequested;
	if(debugging_)
		flags |= opaqueDebugging;
	if(halted_)
		flags |= opaqueHalted;
	if(nmiPending_)
		flags |= opaqueNmiPending;
	state.data[0] = flags;
	for(size_t i = 0; i < 256; ++i)
		if(pending_.test(i))
			state.data[1 + i / 8] |= 1 << (i % 8);
	return snapshot;
}

Result<> SimVcpu::checkRestore(const VcpuSnapshot &snapshot) const {
	if(auto outcome = tracker_.checkNotRunning("restore"); !outcome)
		return outcome;
	if(snapshot.id != id_)
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.id, "restore");
	if(auto outcome = checkOpaque(snapshot.backendState, HypervisorKind::sim, vcpuStateVersion);
			!outcome)
		return outcome;
	if(snapshot.backendState.data.size() != opaqueSize)
		return makeError(ErrorKind::incompatibleSnapshot, id_, "restore");
	// This backend cannot load debug registers.
	if(snapshot.debugRegs)
		return makeError(ErrorKind::incompatibleSnapshot, id_, "restore");
	return {};
}

Result<> SimVcpu::restore(const VcpuSnapshot &snapshot) {
	if(auto outcome = checkRestore(snapshot); !outcome)
		return outcome;

	regs_ = snapshot.regs;
	sregs_ = snapshot.sregs;
	if(snapshot.fpu)
		fpu_ = *snapshot.fpu;
	pendingRead_ = PendingRead::none;

	auto &data = snapshot.backendState.data;
	std::lock_guard lock{irqMutex_};
	windowRequested_ = data[0] & opaqueWindowRequested;
	debugging_ = data[0] & opaqueDebugging;
	halted_ = data[0] & opaqueHalted;
	nmiPending_ = data[0] & opaqueNmiPending;
	for(size_t i = 0; i < 256; ++i)
		pending_[i] = data[1 + i / 8] & (1 << (i % 8));
	return {};
}

} // namespace hv::sim
