#include <errno.h>
#include <signal.h>
#include <string.h>
#include <sys/ioctl.h>
#include <iostream>

#include "kvm.hpp"

namespace hv::kvm {

namespace {

constexpr bool logExits = false;

// Layout of the opaque vCPU state.
struct SavedVcpuState {
	uint32_t hasXcrs;
	kvm_mp_state mpState;
	kvm_lapic_state lapic;
	kvm_vcpu_events events;
	kvm_xcrs xcrs;
};

SegmentRegister fromKvm(const kvm_segment &seg) {
	SegmentRegister reg{};
	reg.base = seg.base;
	reg.limit = seg.limit;
	reg.selector = seg.selector;
	reg.type = seg.type;
	reg.present = seg.present;
	reg.dpl = seg.dpl;
	reg.db = seg.db;
	reg.s = seg.s;
	reg.l = seg.l;
	reg.g = seg.g;
	reg.avl = seg.avl;
	reg.unusable = seg.unusable;
	return reg;
}

kvm_segment toKvm(const SegmentRegister &reg) {
	kvm_segment seg{};
	seg.base = reg.base;
	seg.limit = reg.limit;
	seg.selector = reg.selector;
	seg.type = reg.type;
	seg.present = reg.present;
	seg.dpl = reg.dpl;
	seg.db = reg.db;
	seg.s = reg.s;
	seg.l = reg.l;
	seg.g = reg.g;
	seg.avl = reg.avl;
	seg.unusable = reg.unusable;
	return seg;
}

DescriptorTable fromKvm(const kvm_dtable &table) {
	return DescriptorTable{table.base, table.limit};
}

kvm_dtable toKvm(const DescriptorTable &table) {
	kvm_dtable dtable{};
	dtable.base = table.base;
	dtable.limit = table.limit;
	return dtable;
}

} // anonymous namespace

KvmVcpu::KvmVcpu(KvmVm *vm, VcpuId id, UniqueFd fd, HostMapping run)
: vm_{vm}, id_{id}, fd_{std::move(fd)}, runMapping_{std::move(run)},
		run_{static_cast<kvm_run *>(runMapping_.data())}, tracker_{id} {
	tracker_.markRunnable();
}

Result<> KvmVcpu::setCpuid(const std::vector<kvm_cpuid_entry2> &entries) {
	std::vector<uint8_t> buffer(sizeof(kvm_cpuid2) + entries.size() * sizeof(kvm_cpuid_entry2));
	auto cpuid = reinterpret_cast<kvm_cpuid2 *>(buffer.data());
	cpuid->nent = entries.size();
	for(size_t i = 0; i < entries.size(); ++i) {
		auto &entry = cpuid->entries[i];
		entry = entries[i];
		// Initial APIC ID.
		if(entry.function == 1)
			entry.ebx = (entry.ebx & 0x00FF'FFFF) | (id_ << 24);
		else if(entry.function == 0xB || entry.function == 0x1F)
			entry.edx = id_;
	}
	if(ioctl(fd_.get(), KVM_SET_CPUID2, cpuid))
		return backendFailure("KVM_SET_CPUID2", errno, id_);
	return {};
}

// ----------------------------------------------------------------------------
// Execution.
// ----------------------------------------------------------------------------

Result<VcpuExit> KvmVcpu::run() {
	if(auto outcome = tracker_.enterRun(); !outcome)
		return std::unexpected{outcome.error()};

	if(pendingRead_ != PendingRead::none) {
		tracker_.leaveRun(false);
		return makeError(ErrorKind::illegalState, id_, "run");
	}

	{
		std::lock_guard lock{kickMutex_};
		thread_ = pthread_self();
		inRun_ = true;
	}

	int result = ioctl(fd_.get(), KVM_RUN, 0);
	int error = errno;

	{
		std::lock_guard lock{kickMutex_};
		inRun_ = false;
	}

	if(result < 0) {
		// A kick, or immediate_exit was already set on entry.
		if(error == EINTR || error == EAGAIN) {
			tracker_.leaveRun(true);
			return exits::ImmediateExit{};
		}
		tracker_.leaveRun(false);
		std::cout << "\e[31m" "hv/kvm: KVM_RUN failed on vCPU " << id_ << ": "
				<< strerror(error) << "\e[39m" << std::endl;
		return backendFailure("KVM_RUN", error, id_);
	}

	auto exit = decodeExit();
	tracker_.leaveRun(true);
	if(logExits)
		std::cout << "hv/kvm: vCPU " << id_ << " exits with " << exit << std::endl;
	return exit;
}

VcpuExit KvmVcpu::decodeExit() {
	auto base = reinterpret_cast<uint8_t *>(run_);

	switch(run_->exit_reason) {
	case KVM_EXIT_IO: {
		auto &io = run_->io;
		if(io.direction == KVM_EXIT_IO_IN) {
			pendingRead_ = PendingRead::port;
			pendingSize_ = io.size * io.count;
			return exits::IoIn{io.port, io.size, io.count};
		}
		exits::IoOut out{io.port, io.size, io.count, {}};
		out.data.assign(base + io.data_offset, base + io.data_offset + io.size * io.count);
		return out;
	}
	case KVM_EXIT_MMIO: {
		auto &mmio = run_->mmio;
		if(!mmio.is_write) {
			pendingRead_ = PendingRead::mmio;
			pendingSize_ = mmio.len;
			return exits::MmioRead{mmio.phys_addr, static_cast<uint8_t>(mmio.len)};
		}
		exits::MmioWrite write{mmio.phys_addr, static_cast<uint8_t>(mmio.len), {}};
		memcpy(write.data.data(), mmio.data, sizeof(mmio.data));
		return write;
	}
	case KVM_EXIT_HLT:
		return exits::Hlt{};
	case KVM_EXIT_SHUTDOWN:
		return exits::Shutdown{};
	case KVM_EXIT_IRQ_WINDOW_OPEN:
		return exits::InterruptWindowOpen{};
	case KVM_EXIT_DEBUG: {
		auto &arch = run_->debug.arch;
		return exits::Debug{arch.exception, arch.pc, arch.dr6, arch.dr7};
	}
	case KVM_EXIT_INTR:
		return exits::ImmediateExit{};
	case KVM_EXIT_FAIL_ENTRY:
		return exits::FailEntry{run_->fail_entry.hardware_entry_failure_reason};
	case KVM_EXIT_INTERNAL_ERROR:
		std::cout << "\e[31m" "hv/kvm: Internal error " << run_->internal.suberror
				<< " on vCPU " << id_ << "\e[39m" << std::endl;
		return exits::InternalError{run_->internal.suberror};
	case KVM_EXIT_SYSTEM_EVENT:
		switch(run_->system_event.type) {
		case KVM_SYSTEM_EVENT_SHUTDOWN:
			return exits::SystemEvent{exits::SystemEvent::Type::shutdown};
		case KVM_SYSTEM_EVENT_RESET:
			return exits::SystemEvent{exits::SystemEvent::Type::reset};
		case KVM_SYSTEM_EVENT_CRASH:
			return exits::SystemEvent{exits::SystemEvent::Type::crash};
		}
		break;
	}

	std::cout << "\e[31m" "hv/kvm: Unknown exit reason " << run_->exit_reason
			<< " on vCPU " << id_ << "\e[39m" << std::endl;
	return exits::Unknown{run_->exit_reason};
}

Result<> KvmVcpu::completeRead(std::span<const uint8_t> data) {
	if(auto outcome = tracker_.checkNotRunning("completeRead"); !outcome)
		return outcome;
	if(pendingRead_ == PendingRead::none)
		return makeError(ErrorKind::illegalState, id_, "completeRead");
	if(data.size() != pendingSize_)
		return makeError(ErrorKind::illegalArgs, data.size(), "completeRead");

	// KVM completes the instruction from kvm_run on the next KVM_RUN.
	if(pendingRead_ == PendingRead::port) {
		auto base = reinterpret_cast<uint8_t *>(run_);
		memcpy(base + run_->io.data_offset, data.data(), data.size());
	}else{
		memcpy(run_->mmio.data, data.data(), data.size());
	}
	pendingRead_ = PendingRead::none;
	return {};
}

// ----------------------------------------------------------------------------
// Registers.
// ----------------------------------------------------------------------------

Result<GeneralRegs> KvmVcpu::getRegs() {
	if(auto outcome = tracker_.checkNotRunning("getRegs"); !outcome)
		return std::unexpected{outcome.error()};

	kvm_regs kregs;
	if(ioctl(fd_.get(), KVM_GET_REGS, &kregs))
		return backendFailure("KVM_GET_REGS", errno, id_);

	GeneralRegs regs;
	regs.rax = kregs.rax;
	regs.rbx = kregs.rbx;
	regs.rcx = kregs.rcx;
	regs.rdx = kregs.rdx;
	regs.rsi = kregs.rsi;
	regs.rdi = kregs.rdi;
	regs.rbp = kregs.rbp;
	regs.r8 = kregs.r8;
	regs.r9 = kregs.r9;
	regs.r10 = kregs.r10;
	regs.r11 = kregs.r11;
	regs.r12 = kregs.r12;
	regs.r13 = kregs.r13;
	regs.r14 = kregs.r14;
	regs.r15 = kregs.r15;
	regs.rsp = kregs.rsp;
	regs.rip = kregs.rip;
	regs.rflags = kregs.rflags;
	return regs;
}

Result<> KvmVcpu::setRegs(const GeneralRegs &regs) {
	if(auto outcome = tracker_.checkNotRunning("setRegs"); !outcome)
		return outcome;

	kvm_regs kregs{};
	kregs.rax = regs.rax;
	kregs.rbx = regs.rbx;
	kregs.rcx = regs.rcx;
	kregs.rdx = regs.rdx;
	kregs.rsi = regs.rsi;
	kregs.rdi = regs.rdi;
	kregs.rbp = regs.rbp;
	kregs.r8 = regs.r8;
	kregs.r9 = regs.r9;
	kregs.r10 = regs.r10;
	kregs.r11 = regs.r11;
	kregs.r12 = regs.r12;
	kregs.r13 = regs.r13;
	kregs.r14 = regs.r14;
	kregs.r15 = regs.r15;
	kregs.rsp = regs.rsp;
	kregs.rip = regs.rip;
	kregs.rflags = regs.rflags;
	if(ioctl(fd_.get(), KVM_SET_REGS, &kregs))
		return backendFailure("KVM_SET_REGS", errno, id_);
	return {};
}

Result<SpecialRegs> KvmVcpu::getSregs() {
	if(auto outcome = tracker_.checkNotRunning("getSregs"); !outcome)
		return std::unexpected{outcome.error()};

	kvm_sregs ksregs;
	if(ioctl(fd_.get(), KVM_GET_SREGS, &ksregs))
		return backendFailure("KVM_GET_SREGS", errno, id_);

	SpecialRegs sregs;
	sregs.cs = fromKvm(ksregs.cs);
	sregs.ds = fromKvm(ksregs.ds);
	sregs.es = fromKvm(ksregs.es);
	sregs.fs = fromKvm(ksregs.fs);
	sregs.gs = fromKvm(ksregs.gs);
	sregs.ss = fromKvm(ksregs.ss);
	sregs.tr = fromKvm(ksregs.tr);
	sregs.ldt = fromKvm(ksregs.ldt);
	sregs.gdt = fromKvm(ksregs.gdt);
	sregs.idt = fromKvm(ksregs.idt);
	sregs.cr0 = ksregs.cr0;
	sregs.cr2 = ksregs.cr2;
	sregs.cr3 = ksregs.cr3;
	sregs.cr4 = ksregs.cr4;
	sregs.cr8 = ksregs.cr8;
	sregs.efer = ksregs.efer;
	sregs.apicBase = ksregs.apic_base;
	for(size_t i = 0; i < sregs.interruptBitmap.size(); ++i)
		sregs.interruptBitmap[i] = ksregs.interrupt_bitmap[i];
	return sregs;
}

Result<> KvmVcpu::setSregs(const SpecialRegs &sregs) {
	if(auto outcome = tracker_.checkNotRunning("setSregs"); !outcome)
		return outcome;

	kvm_sregs ksregs{};
	ksregs.cs = toKvm(sregs.cs);
	ksregs.ds = toKvm(sregs.ds);
	ksregs.es = toKvm(sregs.es);
	ksregs.fs = toKvm(sregs.fs);
	ksregs.gs = toKvm(sregs.gs);
	ksregs.ss = toKvm(sregs.ss);
	ksregs.tr = toKvm(sregs.tr);
	ksregs.ldt = toKvm(sregs.ldt);
	ksregs.gdt = toKvm(sregs.gdt);
	ksregs.idt = toKvm(sregs.idt);
	ksregs.cr0 = sregs.cr0;
	ksregs.cr2 = sregs.cr2;
	ksregs.cr3 = sregs.cr3;
	ksregs.cr4 = sregs.cr4;
	ksregs.cr8 = sregs.cr8;
	ksregs.efer = sregs.efer;
	ksregs.apic_base = sregs.apicBase;
	for(size_t i = 0; i < sregs.interruptBitmap.size(); ++i)
		ksregs.interrupt_bitmap[i] = sregs.interruptBitmap[i];
	if(ioctl(fd_.get(), KVM_SET_SREGS, &ksregs))
		return backendFailure("KVM_SET_SREGS", errno, id_);
	return {};
}

Result<FpuRegs> KvmVcpu::getFpu() {
	if(auto outcome = tracker_.checkNotRunning("getFpu"); !outcome)
		return std::unexpected{outcome.error()};

	kvm_fpu kfpu;
	if(ioctl(fd_.get(), KVM_GET_FPU, &kfpu))
		return backendFailure("KVM_GET_FPU", errno, id_);

	FpuRegs fpu;
	memcpy(fpu.fpr.data(), kfpu.fpr, sizeof(kfpu.fpr));
	fpu.fcw = kfpu.fcw;
	fpu.fsw = kfpu.fsw;
	fpu.ftwx = kfpu.ftwx;
	fpu.lastOpcode = kfpu.last_opcode;
	fpu.lastIp = kfpu.last_ip;
	fpu.lastDp = kfpu.last_dp;
	memcpy(fpu.xmm.data(), kfpu.xmm, sizeof(kfpu.xmm));
	fpu.mxcsr = kfpu.mxcsr;
	return fpu;
}

Result<> KvmVcpu::setFpu(const FpuRegs &fpu) {
	if(auto outcome = tracker_.checkNotRunning("setFpu"); !outcome)
		return outcome;

	kvm_fpu kfpu{};
	memcpy(kfpu.fpr, fpu.fpr.data(), sizeof(kfpu.fpr));
	kfpu.fcw = fpu.fcw;
	kfpu.fsw = fpu.fsw;
	kfpu.ftwx = fpu.ftwx;
	kfpu.last_opcode = fpu.lastOpcode;
	kfpu.last_ip = fpu.lastIp;
	kfpu.last_dp = fpu.lastDp;
	memcpy(kfpu.xmm, fpu.xmm.data(), sizeof(kfpu.xmm));
	kfpu.mxcsr = fpu.mxcsr;
	if(ioctl(fd_.get(), KVM_SET_FPU, &kfpu))
		return backendFailure("KVM_SET_FPU", errno, id_);
	return {};
}

bool KvmVcpu::hasDebugRegs() const {
	return vm_->hypervisor().extension(KVM_CAP_DEBUGREGS);
}

Result<DebugRegs> KvmVcpu::getDebugRegs() {
	if(!hasDebugRegs())
		return makeError(ErrorKind::unsupported, id_, "getDebugRegs");
	if(auto outcome = tracker_.checkNotRunning("getDebugRegs"); !outcome)
		return std::unexpected{outcome.error()};

	kvm_debugregs kregs;
	if(ioctl(fd_.get(), KVM_GET_DEBUGREGS, &kregs))
		return backendFailure("KVM_GET_DEBUGREGS", errno, id_);

	DebugRegs regs;
	for(size_t i = 0; i < regs.db.size(); ++i)
		regs.db[i] = kregs.db[i];
	regs.dr6 = kregs.dr6;
	regs.dr7 = kregs.dr7;
	return regs;
}

Result<> KvmVcpu::setDebugRegs(const DebugRegs &regs) {
	if(!hasDebugRegs())
		return makeError(ErrorKind::unsupported, id_, "setDebugRegs");
	if(auto outcome = tracker_.checkNotRunning("setDebugRegs"); !outcome)
		return outcome;

	kvm_debugregs kregs{};
	for(size_t i = 0; i < regs.db.size(); ++i)
		kregs.db[i] = regs.db[i];
	kregs.dr6 = regs.dr6;
	kregs.dr7 = regs.dr7;
	if(ioctl(fd_.get(), KVM_SET_DEBUGREGS, &kregs))
		return backendFailure("KVM_SET_DEBUGREGS", errno, id_);
	return {};
}

// ----------------------------------------------------------------------------
// Interrupts and cancellation.
// ----------------------------------------------------------------------------

Result<> KvmVcpu::requestInterruptWindow() {
	if(auto outcome = tracker_.checkNotRunning("requestInterruptWindow"); !outcome)
		return outcome;
	run_->request_interrupt_window = 1;
	return {};
}

bool KvmVcpu::readyForInterrupt() {
	return run_->ready_for_interrupt_injection && run_->if_flag;
}

Result<> KvmVcpu::injectNmi() {
	if(ioctl(fd_.get(), KVM_NMI, 0))
		return backendFailure("KVM_NMI", errno, id_);
	return {};
}

void KvmVcpu::setImmediateExit(bool exit) {
	__atomic_store_n(&run_->immediate_exit, exit, __ATOMIC_SEQ_CST);
	if(!exit)
		return;

	std::lock_guard lock{kickMutex_};
	if(inRun_) {
		if(int error = pthread_kill(thread_, kickSignal()); error)
			std::cout << "\e[31m" "hv/kvm: Failed to kick vCPU " << id_ << ": "
					<< strerror(error) << "\e[39m" << std::endl;
	}
}

void KvmVcpu::requestStop() {
	tracker_.requestStop();
	setImmediateExit(true);
}

Result<> KvmVcpu::setGuestDebug(uint32_t control) {
	if(!vm_->hypervisor().extension(KVM_CAP_SET_GUEST_DEBUG))
		return makeError(ErrorKind::unsupported, id_, "KVM_SET_GUEST_DEBUG");
	if(auto outcome = tracker_.checkNotRunning("KVM_SET_GUEST_DEBUG"); !outcome)
		return outcome;

	kvm_guest_debug debug{};
	debug.control = control;
	if(ioctl(fd_.get(), KVM_SET_GUEST_DEBUG, &debug))
		return backendFailure("KVM_SET_GUEST_DEBUG", errno, id_);
	return {};
}

Result<> KvmVcpu::debugAttach() {
	return setGuestDebug(KVM_GUESTDBG_ENABLE | KVM_GUESTDBG_SINGLESTEP | KVM_GUESTDBG_USE_SW_BP);
}

Result<> KvmVcpu::debugDetach() {
	return setGuestDebug(0);
}

// ----------------------------------------------------------------------------
// Snapshot.
// ----------------------------------------------------------------------------

Result<VcpuSnapshot> KvmVcpu::snapshot() {
	if(auto outcome = tracker_.checkNotRunning("snapshot"); !outcome)
		return std::unexpected{outcome.error()};

	VcpuSnapshot snapshot;
	snapshot.id = id_;

	auto regs = getRegs();
	if(!regs)
		return std::unexpected{regs.error()};
	snapshot.regs = *regs;

	auto sregs = getSregs();
	if(!sregs)
		return std::unexpected{sregs.error()};
	snapshot.sregs = *sregs;

	auto fpu = getFpu();
	if(!fpu)
		return std::unexpected{fpu.error()};
	snapshot.fpu = *fpu;

	if(hasDebugRegs()) {
		auto debugRegs = getDebugRegs();
		if(!debugRegs)
			return std::unexpected{debugRegs.error()};
		snapshot.debugRegs = *debugRegs;
	}

	SavedVcpuState saved;
	memset(&saved, 0, sizeof(SavedVcpuState));
	if(ioctl(fd_.get(), KVM_GET_MP_STATE, &saved.mpState))
		return backendFailure("KVM_GET_MP_STATE", errno, id_);
	if(ioctl(fd_.get(), KVM_GET_LAPIC, &saved.lapic))
		return backendFailure("KVM_GET_LAPIC", errno, id_);
	if(ioctl(fd_.get(), KVM_GET_VCPU_EVENTS, &saved.events))
		return backendFailure("KVM_GET_VCPU_EVENTS", errno, id_);
	if(vm_->hypervisor().extension(KVM_CAP_XCRS)) {
		if(ioctl(fd_.get(), KVM_GET_XCRS, &saved.xcrs))
			return backendFailure("KVM_GET_XCRS", errno, id_);
		saved.hasXcrs = 1;
	}

	auto &state = snapshot.backendState;
	state.backend = HypervisorKind::kvm;
	state.version = vcpuStateVersion;
	auto bytes = reinterpret_cast<const uint8_t *>(&saved);
	state.data.assign(bytes, bytes + sizeof(SavedVcpuState));
	return snapshot;
}

Result<> KvmVcpu::checkRestore(const VcpuSnapshot &snapshot) const {
	if(auto outcome = tracker_.checkNotRunning("restore"); !outcome)
		return outcome;
	if(snapshot.id != id_)
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.id, "restore");
	if(auto outcome = checkOpaque(snapshot.backendState, HypervisorKind::kvm, vcpuStateVersion);
			!outcome)
		return outcome;
	if(snapshot.backendState.data.size() != sizeof(SavedVcpuState))
		return makeError(ErrorKind::incompatibleSnapshot, id_, "restore");
	if(snapshot.debugRegs && !hasDebugRegs())
		return makeError(ErrorKind::incompatibleSnapshot, id_, "restore");
	return {};
}

Result<> KvmVcpu::restore(const VcpuSnapshot &snapshot) {
	if(auto outcome = checkRestore(snapshot); !outcome)
		return outcome;

	SavedVcpuState saved;
	memcpy(&saved, snapshot.backendState.data.data(), sizeof(SavedVcpuState));

	// Special registers first: they determine how the others are interpreted.
	if(auto outcome = setSregs(snapshot.sregs); !outcome)
		return outcome;
	if(auto outcome = setRegs(snapshot.regs); !outcome)
		return outcome;
	if(snapshot.fpu)
		if(auto outcome = setFpu(*snapshot.fpu); !outcome)
			return outcome;
	if(snapshot.debugRegs)
		if(auto outcome = setDebugRegs(*snapshot.debugRegs); !outcome)
			return outcome;

	if(saved.hasXcrs && vm_->hypervisor().extension(KVM_CAP_XCRS)) {
		if(ioctl(fd_.get(), KVM_SET_XCRS, &saved.xcrs))
			return backendFailure("KVM_SET_XCRS", errno, id_);
	}
	if(ioctl(fd_.get(), KVM_SET_LAPIC, &saved.lapic))
		return backendFailure("KVM_SET_LAPIC", errno, id_);
	if(ioctl(fd_.get(), KVM_SET_MP_STATE, &saved.mpState))
		return backendFailure("KVM_SET_MP_STATE", errno, id_);
	if(ioctl(fd_.get(), KVM_SET_VCPU_EVENTS, &saved.events))
		return backendFailure("KVM_SET_VCPU_EVENTS", errno, id_);

	pendingRead_ = PendingRead::none;
	return {};
}

} // namespace hv::kvm
