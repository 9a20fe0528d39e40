#pragma once

#include <stdint.h>
#include <array>

namespace hv {

struct GeneralRegs {
	uint64_t rax;
	uint64_t rbx;
	uint64_t rcx;
	uint64_t rdx;
	uint64_t rsi;
	uint64_t rdi;
	uint64_t rbp;
	uint64_t r8;
	uint64_t r9;
	uint64_t r10;
	uint64_t r11;
	uint64_t r12;
	uint64_t r13;
	uint64_t r14;
	uint64_t r15;

	uint64_t rsp;
	uint64_t rip;
	uint64_t rflags;

	bool operator== (const GeneralRegs &) const = default;
};

constexpr uint64_t kRflagsReserved = 1 << 1;
constexpr uint64_t kRflagsInterrupt = 1 << 9;

struct SegmentRegister {
	uint64_t base;
	uint32_t limit;
	uint16_t selector;
	uint8_t type, present, dpl, db, s, l, g, avl;
	uint8_t unusable;

	bool operator== (const SegmentRegister &) const = default;
};

struct DescriptorTable {
	uint64_t base;
	uint16_t limit;

	bool operator== (const DescriptorTable &) const = default;
};

struct SpecialRegs {
	SegmentRegister cs, ds, es, fs, gs, ss;
	SegmentRegister tr, ldt;
	DescriptorTable gdt, idt;

	uint64_t cr0, cr2, cr3, cr4, cr8;
	uint64_t efer;
	uint64_t apicBase;

	// Pending external interrupt, one bit per vector.
	std::array<uint64_t, 4> interruptBitmap;

	bool operator== (const SpecialRegs &) const = default;
};

struct FpuRegs {
	std::array<std::array<uint8_t, 16>, 8> fpr;
	uint16_t fcw;
	uint16_t fsw;
	uint8_t ftwx;
	uint16_t lastOpcode;
	uint64_t lastIp;
	uint64_t lastDp;
	std::array<std::array<uint8_t, 16>, 16> xmm;
	uint32_t mxcsr;

	bool operator== (const FpuRegs &) const = default;
};

struct DebugRegs {
	std::array<uint64_t, 4> db;
	uint64_t dr6;
	uint64_t dr7;

	bool operator== (const DebugRegs &) const = default;
};

// Real mode state at reset: CS:IP = f000:fff0, flat 64 KiB segments.
SpecialRegs resetSpecialRegs();

} // namespace hv
