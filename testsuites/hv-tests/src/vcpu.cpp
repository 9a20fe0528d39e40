#include <assert.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

#include <hv/sim.hpp>
#include <hv/vcpu.hpp>

#include "testsuite.hpp"

namespace actions = hv::sim::actions;

namespace {

hv::sim::GuestAction idle(hv::sim::GuestContext &) {
	return actions::WaitForInterrupt{};
}

void waitUntilRunning(hv::Vcpu &vcpu) {
	while(vcpu.state() != hv::RunState::running)
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

} // anonymous namespace

DEFINE_TEST(vcpu_id_bounds, ([] {
	auto machine = make_sim_machine(2);
	auto &vm = *machine.vm;

	assert_error(vm.createVcpu(2), hv::ErrorKind::resourceExhausted);

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	assert((*vcpu)->id() == 0);
	assert((*vcpu)->state() == hv::RunState::runnable);
	assert_error(vm.createVcpu(0), hv::ErrorKind::resourceExhausted);

	// IDs are not recycled when the vCPU goes away.
	vcpu->reset();
	assert_error(vm.createVcpu(0), hv::ErrorKind::resourceExhausted);
	assert(vm.createVcpu(1));
}))

DEFINE_TEST(vcpu_register_roundtrip, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	hv::GeneralRegs regs{};
	regs.rax = 0x1122334455667788;
	regs.r15 = 42;
	regs.rip = 0x7C00;
	regs.rsp = 0x8000;
	regs.rflags = hv::kRflagsReserved | hv::kRflagsInterrupt;
	assert((*vcpu)->setRegs(regs));
	assert(*(*vcpu)->getRegs() == regs);

	auto sregs = hv::resetSpecialRegs();
	sregs.cs.base = 0;
	sregs.cs.selector = 0;
	sregs.cr3 = 0x1000;
	sregs.efer = 0x500;
	assert((*vcpu)->setSregs(sregs));
	assert(*(*vcpu)->getSregs() == sregs);

	hv::FpuRegs fpu{};
	fpu.fcw = 0x37F;
	fpu.mxcsr = 0x1F80;
	fpu.xmm[3][7] = 0xAA;
	fpu.fpr[1][0] = 0x55;
	assert((*vcpu)->setFpu(fpu));
	assert(*(*vcpu)->getFpu() == fpu);

	// Unsupported classes fail the same way every time.
	assert_error((*vcpu)->getDebugRegs(), hv::ErrorKind::unsupported);
	assert_error((*vcpu)->setDebugRegs(hv::DebugRegs{}), hv::ErrorKind::unsupported);
	assert_error((*vcpu)->getDebugRegs(), hv::ErrorKind::unsupported);
}))

DEFINE_TEST(vcpu_run_without_program, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	auto exit = (*vcpu)->run();
	assert(exit);
	assert(std::holds_alternative<hv::exits::FailEntry>(*exit));
	assert((*vcpu)->state() == hv::RunState::exited);
}))

DEFINE_TEST(vcpu_exit_decoding, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		switch(step++) {
		case 0: return actions::Halt{};
		case 1: return actions::RawExit{0x1234};
		case 2: return actions::Fault{3};
		case 3: return actions::Shutdown{};
		default: return actions::Halt{};
		}
	}));

	auto exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));
	assert((*vcpu)->state() == hv::RunState::exited);

	exit = (*vcpu)->run();
	assert(exit);
	auto unknown = std::get_if<hv::exits::Unknown>(&*exit);
	assert(unknown && unknown->code == 0x1234);

	exit = (*vcpu)->run();
	assert(exit);
	auto internal = std::get_if<hv::exits::InternalError>(&*exit);
	assert(internal && internal->suberror == 3);

	exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Shutdown>(*exit));
}))

DEFINE_TEST(vcpu_port_in_complete_read, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &ctx) mutable -> hv::sim::GuestAction {
		if(step++ == 0)
			return actions::PortIn{0x60, 1};
		return actions::PortOut{0x61, 1, ctx.regs().rax & 0xFF};
	}));

	assert_error((*vcpu)->completeRead(std::vector<uint8_t>{1}), hv::ErrorKind::illegalState);

	auto exit = (*vcpu)->run();
	assert(exit);
	auto in = std::get_if<hv::exits::IoIn>(&*exit);
	assert(in && in->port == 0x60 && in->size == 1 && in->count == 1);

	// The read must be completed before the guest can continue.
	assert_error((*vcpu)->run(), hv::ErrorKind::illegalState);
	assert_error((*vcpu)->completeRead(std::vector<uint8_t>{1, 2}), hv::ErrorKind::illegalArgs);
	assert((*vcpu)->completeRead(std::vector<uint8_t>{0x5A}));

	exit = (*vcpu)->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x61);
	assert(out->data == std::vector<uint8_t>{0x5A});
}))

DEFINE_TEST(vcpu_mmio, ([] {
	auto machine = make_sim_machine(1, 0x10000);
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &ctx) mutable -> hv::sim::GuestAction {
		switch(step++) {
		// RAM accesses do not exit.
		case 0: return actions::MmioWrite{0x100, 2, 0xBEEF};
		case 1: return actions::MmioRead{0x100, 2};
		case 2: return actions::PortOut{0x80, 2,
				uint64_t{ctx.readResult()[0]} | (uint64_t{ctx.readResult()[1]} << 8)};
		// Unbacked accesses do.
		case 3: return actions::MmioWrite{0xFEC00000, 4, 0x12345678};
		case 4: return actions::MmioRead{0xFEC00010, 4};
		default: return actions::PortOut{0x80, 1, ctx.readResult()[3]};
		}
	}));

	auto exit = (*vcpu)->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->data == (std::vector<uint8_t>{0xEF, 0xBE}));

	exit = (*vcpu)->run();
	assert(exit);
	auto write = std::get_if<hv::exits::MmioWrite>(&*exit);
	assert(write && write->address == 0xFEC00000 && write->size == 4);
	assert(write->data[0] == 0x78 && write->data[3] == 0x12);

	exit = (*vcpu)->run();
	assert(exit);
	auto read = std::get_if<hv::exits::MmioRead>(&*exit);
	assert(read && read->address == 0xFEC00010 && read->size == 4);
	assert((*vcpu)->completeRead(std::vector<uint8_t>{1, 2, 3, 4}));

	exit = (*vcpu)->run();
	assert(exit);
	out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->data == std::vector<uint8_t>{4});
}))

DEFINE_TEST(vcpu_interrupt_window, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &ctx) mutable -> hv::sim::GuestAction {
		if(step++ == 0) {
			ctx.regs().rflags |= hv::kRflagsInterrupt;
			return actions::Continue{};
		}
		return actions::Halt{};
	}));

	assert(!(*vcpu)->readyForInterrupt());
	assert((*vcpu)->requestInterruptWindow());

	auto exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::InterruptWindowOpen>(*exit));
	assert((*vcpu)->readyForInterrupt());

	// The request is consumed by the exit.
	exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));
}))

DEFINE_TEST(vcpu_nmi, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);
	assert(hv::sim::loadGuestProgram(**vcpu,
			[] (hv::sim::GuestContext &ctx) -> hv::sim::GuestAction {
		if(auto vector = ctx.acknowledgeInterrupt())
			return actions::PortOut{0x80, 1, *vector};
		return actions::WaitForInterrupt{};
	}));

	// Delivered although RFLAGS.IF is clear.
	assert((*vcpu)->injectNmi());
	auto exit = (*vcpu)->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->data == std::vector<uint8_t>{2});
}))

DEFINE_TEST(vcpu_immediate_exit_sticky, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);
	assert(hv::sim::loadGuestProgram(**vcpu, [] (hv::sim::GuestContext &) -> hv::sim::GuestAction {
		return actions::Halt{};
	}));

	(*vcpu)->setImmediateExit(true);
	for(int i = 0; i < 2; ++i) {
		auto exit = (*vcpu)->run();
		assert(exit && std::holds_alternative<hv::exits::ImmediateExit>(*exit));
		assert((*vcpu)->state() == hv::RunState::exited);
	}

	(*vcpu)->setImmediateExit(false);
	auto exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));
}))

DEFINE_TEST(vcpu_immediate_exit_wakes_idle, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);
	assert(hv::sim::loadGuestProgram(**vcpu, idle));

	std::optional<hv::Result<hv::VcpuExit>> result;
	std::thread runner{[&] {
		result = (*vcpu)->run();
	}};

	waitUntilRunning(**vcpu);

	// Another run() and state access are rejected meanwhile.
	assert_error((*vcpu)->run(), hv::ErrorKind::illegalState);
	assert_error((*vcpu)->getRegs(), hv::ErrorKind::illegalState);
	assert_error((*vcpu)->snapshot(), hv::ErrorKind::illegalState);

	(*vcpu)->setImmediateExit(true);
	runner.join();
	assert(result && *result);
	assert(std::holds_alternative<hv::exits::ImmediateExit>(**result));
	assert((*vcpu)->state() == hv::RunState::exited);
}))

DEFINE_TEST(vcpu_masked_idle_blocks, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	std::vector<hv::IrqRoute> routes{{4, hv::IrqchipPin{hv::IrqChip::ioapic, 4}}};
	assert(vm.setIrqRouting(routes));

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);

	// RFLAGS.IF is clear after reset.
	std::atomic<int> steps{0};
	assert(hv::sim::loadGuestProgram(**vcpu,
			[&steps] (hv::sim::GuestContext &ctx) -> hv::sim::GuestAction {
		steps++;
		if(auto vector = ctx.acknowledgeInterrupt())
			return actions::PortOut{0x80, 1, *vector};
		return actions::WaitForInterrupt{};
	}));

	std::optional<hv::Result<hv::VcpuExit>> result;
	std::thread runner{[&] {
		result = (*vcpu)->run();
	}};

	waitUntilRunning(**vcpu);
	assert(vm.injectIrq(4, true));
	assert(vm.injectIrq(4, false));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	assert(steps == 1);

	(*vcpu)->setImmediateExit(true);
	runner.join();
	assert(result && *result);
	assert(std::holds_alternative<hv::exits::ImmediateExit>(**result));

	// Unmasking delivers the latched vector.
	(*vcpu)->setImmediateExit(false);
	auto regs = (*vcpu)->getRegs();
	assert(regs);
	regs->rflags |= hv::kRflagsInterrupt;
	assert((*vcpu)->setRegs(*regs));

	auto exit = (*vcpu)->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x80 && out->data == std::vector<uint8_t>{0x34});
}))

DEFINE_TEST(vcpu_request_stop, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);
	assert(hv::sim::loadGuestProgram(**vcpu, idle));

	std::optional<hv::Result<hv::VcpuExit>> result;
	std::thread runner{[&] {
		result = (*vcpu)->run();
	}};

	waitUntilRunning(**vcpu);
	(*vcpu)->requestStop();
	runner.join();

	assert(result && *result);
	assert(std::holds_alternative<hv::exits::ImmediateExit>(**result));
	assert((*vcpu)->state() == hv::RunState::stopped);

	// Stopped is final, even with immediate exit cleared.
	(*vcpu)->setImmediateExit(false);
	assert_error((*vcpu)->run(), hv::ErrorKind::illegalState);
	assert((*vcpu)->state() == hv::RunState::stopped);
	assert(std::string_view{hv::runStateName((*vcpu)->state())} == "stopped");
}))

DEFINE_TEST(vcpu_debug_exits, ([] {
	auto machine = make_sim_machine();
	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);

	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &ctx) mutable -> hv::sim::GuestAction {
		ctx.regs().rip += 1;
		switch(step++) {
		case 0: return actions::Continue{};
		case 1: return actions::Breakpoint{};
		case 2: return actions::Breakpoint{};
		default: return actions::Halt{};
		}
	}));

	assert((*vcpu)->debugAttach());

	auto exit = (*vcpu)->run();
	assert(exit);
	auto debug = std::get_if<hv::exits::Debug>(&*exit);
	assert(debug && debug->exception == 1 && debug->pc == 0xFFF1);

	exit = (*vcpu)->run();
	assert(exit);
	debug = std::get_if<hv::exits::Debug>(&*exit);
	assert(debug && debug->exception == 3);

	// Without a debugger, breakpoints stay inside the guest.
	assert((*vcpu)->debugDetach());
	exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));
}))
