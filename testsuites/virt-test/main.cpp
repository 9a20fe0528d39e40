#include <string.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <yaml-cpp/yaml.h>

#include <hv/hypervisor.hpp>
#include <hv/sim.hpp>
#include <hv/snapshot.hpp>

// Runs a real-mode guest described by a YAML file and prints its exits.
//
//   backend: kvm
//   vcpus: 1
//   memory: 0x10000
//   entry: 0x7c00
//   code: [0xb0, 0x42, 0xe6, 0x80]

namespace {

struct MachineDescription {
	hv::HypervisorKind backend = hv::HypervisorKind::kvm;
	uint32_t vcpus = 1;
	uint64_t memory = 0x10000;
	uint64_t entry = 0x7C00;
	std::vector<uint8_t> code;
};

bool parseDescription(const std::string &path, MachineDescription &desc) {
	YAML::Node config;
	try {
		config = YAML::LoadFile(path);
	} catch(const YAML::Exception &e) {
		std::cout << "\e[31m" "virt-test: Failed to load " << path << ": " << e.what()
				<< "\e[39m" << std::endl;
		return false;
	}

	try {
		if(config["backend"]) {
			auto backend = config["backend"].as<std::string>();
			if(backend == "kvm") {
				desc.backend = hv::HypervisorKind::kvm;
			}else if(backend == "sim") {
				desc.backend = hv::HypervisorKind::sim;
			}else{
				std::cout << "\e[31m" "virt-test: Unknown backend " << backend << "\e[39m"
						<< std::endl;
				return false;
			}
		}
		if(config["vcpus"])
			desc.vcpus = config["vcpus"].as<uint32_t>();
		if(config["memory"])
			desc.memory = config["memory"].as<uint64_t>();
		if(config["entry"])
			desc.entry = config["entry"].as<uint64_t>();
		for(size_t i = 0; i < config["code"].size(); i++)
			desc.code.push_back(config["code"][i].as<unsigned int>());
	} catch(const YAML::Exception &e) {
		std::cout << "\e[31m" "virt-test: Bad machine description: " << e.what()
				<< "\e[39m" << std::endl;
		return false;
	}

	if(desc.entry > desc.memory || desc.code.size() > desc.memory - desc.entry) {
		std::cout << "\e[31m" "virt-test: Code does not fit into guest memory" "\e[39m"
				<< std::endl;
		return false;
	}
	return true;
}

// Real mode with CS based at 0 so that entry is a flat guest address.
hv::Result<> setupVcpu(hv::Vcpu &vcpu, uint64_t entry) {
	auto sregs = vcpu.getSregs();
	if(!sregs)
		return std::unexpected{sregs.error()};
	sregs->cs.base = 0;
	sregs->cs.selector = 0;
	if(auto outcome = vcpu.setSregs(*sregs); !outcome)
		return outcome;

	hv::GeneralRegs regs{};
	regs.rip = entry;
	regs.rflags = hv::kRflagsReserved;
	return vcpu.setRegs(regs);
}

bool writeSnapshot(hv::Vm &vm, hv::Vcpu &vcpu, const std::string &path) {
	hv::Vcpu *vcpus[] = {&vcpu};
	auto blob = hv::captureMachine(vm, vcpus);
	if(!blob) {
		std::cout << "\e[31m" "virt-test: Snapshot failed: " << blob.error() << "\e[39m"
				<< std::endl;
		return false;
	}
	auto bytes = hv::encodeSnapshot(*blob);
	if(!bytes) {
		std::cout << "\e[31m" "virt-test: Snapshot encoding failed: " << bytes.error()
				<< "\e[39m" << std::endl;
		return false;
	}

	std::ofstream out{path, std::ios::binary};
	out.write(reinterpret_cast<const char *>(bytes->data()), bytes->size());
	return static_cast<bool>(out);
}

} // anonymous namespace

int main(int argc, char **argv) {
	std::string input{};
	std::string snapshot{};
	unsigned int maxExits = 1;

	CLI::App app{"virt-test: run a guest to its first exits"};
	app.add_option("input", input, "Path to the machine description")->required();
	app.add_option("-n,--exits", maxExits, "Number of exits to report");
	app.add_option("-s,--snapshot", snapshot, "Write a snapshot after the last exit");
	CLI11_PARSE(app, argc, argv);

	MachineDescription desc;
	if(!parseDescription(input, desc))
		return 1;

	auto hypervisor = hv::openHypervisor(desc.backend);
	if(!hypervisor) {
		std::cout << "\e[31m" "virt-test: Cannot open " << hv::hypervisorKindName(desc.backend)
				<< ": " << hypervisor.error() << "\e[39m" << std::endl;
		return 1;
	}

	hv::VmConfig config;
	config.kind = desc.backend;
	config.vcpuCount = desc.vcpus;
	auto vm = (*hypervisor)->createVm(config);
	if(!vm) {
		std::cout << "\e[31m" "virt-test: Cannot create VM: " << vm.error() << "\e[39m"
				<< std::endl;
		return 1;
	}

	auto mapping = hv::HostMapping::allocateAnonymous(desc.memory);
	if(!mapping) {
		std::cout << "\e[31m" "virt-test: Cannot allocate guest memory: " << mapping.error()
				<< "\e[39m" << std::endl;
		return 1;
	}
	if(!desc.code.empty())
		memcpy(mapping->bytes().data() + desc.entry, desc.code.data(), desc.code.size());

	hv::MemoryRegion ram;
	ram.size = desc.memory;
	ram.mapping = std::move(*mapping);
	if(auto slot = (*vm)->addMemoryRegion(std::move(ram)); !slot) {
		std::cout << "\e[31m" "virt-test: Cannot install guest memory: " << slot.error()
				<< "\e[39m" << std::endl;
		return 1;
	}

	auto vcpu = (*vm)->createVcpu(0);
	if(!vcpu) {
		std::cout << "\e[31m" "virt-test: Cannot create vCPU: " << vcpu.error() << "\e[39m"
				<< std::endl;
		return 1;
	}
	if(auto outcome = setupVcpu(**vcpu, desc.entry); !outcome) {
		std::cout << "\e[31m" "virt-test: Cannot load registers: " << outcome.error()
				<< "\e[39m" << std::endl;
		return 1;
	}

	// The software backend does not decode instructions; it only halts.
	if(desc.backend == hv::HypervisorKind::sim) {
		std::cout << "virt-test: Guest code is not executed by the sim backend" << std::endl;
		auto outcome = hv::sim::loadGuestProgram(**vcpu, [] (hv::sim::GuestContext &) {
			return hv::sim::GuestAction{hv::sim::actions::Halt{}};
		});
		if(!outcome) {
			std::cout << "\e[31m" "virt-test: Cannot load guest program: " << outcome.error()
					<< "\e[39m" << std::endl;
			return 1;
		}
	}

	for(unsigned int i = 0; i < maxExits; i++) {
		auto exit = (*vcpu)->run();
		if(!exit) {
			std::cout << "\e[31m" "virt-test: run() failed: " << exit.error() << "\e[39m"
					<< std::endl;
			return 1;
		}
		std::cout << "virt-test: " << *exit << std::endl;

		// Reads complete with zeros.
		if(auto in = std::get_if<hv::exits::IoIn>(&*exit)) {
			std::vector<uint8_t> zeros(in->size * in->count);
			if(auto outcome = (*vcpu)->completeRead(zeros); !outcome)
				return 1;
		}else if(auto read = std::get_if<hv::exits::MmioRead>(&*exit)) {
			std::vector<uint8_t> zeros(read->size);
			if(auto outcome = (*vcpu)->completeRead(zeros); !outcome)
				return 1;
		}else if(!std::holds_alternative<hv::exits::IoOut>(*exit)
				&& !std::holds_alternative<hv::exits::MmioWrite>(*exit)) {
			break;
		}
	}

	if(!snapshot.empty() && !writeSnapshot(**vm, **vcpu, snapshot))
		return 1;
	return 0;
}
