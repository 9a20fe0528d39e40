#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <utility>

#include <hv/error.hpp>
#include <hv/hypervisor.hpp>
#include <hv/memory.hpp>
#include <hv/vm.hpp>

#define DEFINE_TEST(s, f) \
	static test_case test_ ## s{#s, f};

struct abstract_test_case {
private:
	static void register_case(abstract_test_case *tcp);

public:
	abstract_test_case(const char *name)
	: name_{name} {
		register_case(this);
	}

	abstract_test_case(const abstract_test_case &) = delete;

	virtual ~abstract_test_case() = default;

	abstract_test_case &operator= (const abstract_test_case &) = delete;

	const char *name() {
		return name_;
	}

	virtual void run() = 0;

private:
	const char *name_;
};

template<typename F>
struct test_case : abstract_test_case {
	test_case(const char *name, F functor)
	: abstract_test_case{name}, functor_{std::move(functor)} { }

	void run() override {
		functor_();
	}

private:
	F functor_;
};

#define assert_error(expr, kind) \
	assert_error_check((expr), (kind), #expr, __FILE__, __PRETTY_FUNCTION__, __LINE__)

template<typename T>
void assert_error_check(const hv::Result<T> &result, hv::ErrorKind kind, const char *expr,
		const char *file, const char *func, int line) {
	if(!result && result.error().kind == kind)
		return;
	fprintf(stderr, "In function %s, file %s:%d: Expected '%s' to fail with '%s', got '%s'\n",
			func, file, line, expr, hv::errorKindName(kind),
			result ? "success" : hv::errorKindName(result.error().kind));
	abort();
	__builtin_unreachable();
}

// A software-backed VM together with the context it was created from.
// Members are destroyed in reverse order, so the VM goes first.
struct sim_machine {
	std::unique_ptr<hv::Hypervisor> hypervisor;
	std::unique_ptr<hv::Vm> vm;
};

inline sim_machine make_sim_machine(uint32_t vcpuCount = 1, uint64_t memorySize = 0,
		hv::SimLimits limits = {}) {
	sim_machine machine;
	machine.hypervisor = hv::openSim(limits);

	hv::VmConfig config;
	config.kind = hv::HypervisorKind::sim;
	config.vcpuCount = vcpuCount;
	config.memorySize = memorySize;
	auto vm = machine.hypervisor->createVm(config);
	if(!vm) {
		fprintf(stderr, "Failed to create VM: %s\n", hv::errorKindName(vm.error().kind));
		abort();
	}
	machine.vm = std::move(*vm);
	return machine;
}

inline hv::MemoryRegion make_region(hv::GuestAddress address, uint64_t size,
		bool logDirty = false, bool readOnly = false) {
	auto mapping = hv::HostMapping::allocateAnonymous(size);
	if(!mapping) {
		fprintf(stderr, "Failed to allocate guest memory: %s\n",
				hv::errorKindName(mapping.error().kind));
		abort();
	}
	hv::MemoryRegion region;
	region.guestAddress = address;
	region.mapping = std::move(*mapping);
	region.size = size;
	region.logDirty = logDirty;
	region.readOnly = readOnly;
	return region;
}
