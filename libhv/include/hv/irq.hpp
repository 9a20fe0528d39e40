#pragma once

#include <stdint.h>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <variant>
#include <vector>

#include <hv/error.hpp>
#include <hv/types.hpp>

namespace hv {

// Numbering matches the x86 irqchip identifiers of KVM.
enum class IrqChip : uint32_t {
	picPrimary = 0,
	picSecondary = 1,
	ioapic = 2
};

enum class TriggerMode {
	edge,
	level
};

struct IrqchipPin {
	IrqChip chip;
	uint32_t pin;

	bool operator== (const IrqchipPin &) const = default;
};

struct MsiMessage {
	uint64_t address;
	uint32_t data;

	bool operator== (const MsiMessage &) const = default;
};

using IrqSource = std::variant<
	IrqchipPin,
	MsiMessage
>;

struct IrqRoute {
	Gsi gsi;
	IrqSource source;

	bool operator== (const IrqRoute &) const = default;
};

// Interrupt controller topology that a backend emulates.
struct IrqChipLayout {
	uint32_t picPrimaryPins = 8;
	uint32_t picSecondaryPins = 8;
	uint32_t ioapicPins = 24;
	uint32_t maxRoutes = 1024;

	uint32_t pinCount(IrqChip chip) const;
};

// GSI n to IOAPIC pin n; the table in effect after VM creation.
std::vector<IrqRoute> defaultX86Routing(const IrqChipLayout &layout);

// Immutable once constructed. Replaced as a whole, never edited in place.
struct RoutingTable {
	RoutingTable(uint64_t version, std::map<Gsi, IrqSource> entries)
	: version_{version}, entries_{std::move(entries)} { }

	uint64_t version() const { return version_; }

	const IrqSource *lookup(Gsi gsi) const;

	std::vector<IrqRoute> routes() const;

	const std::map<Gsi, IrqSource> &entries() const { return entries_; }

private:
	uint64_t version_;
	std::map<Gsi, IrqSource> entries_;
};

// Holds the routing table in effect and the state of level-triggered lines.
// The table pointer itself is guarded by the owning VM's topology lock:
// prepare()/current() need it in shared mode, publish() in exclusive mode.
struct IrqRouter {
	explicit IrqRouter(IrqChipLayout layout);

	IrqRouter(const IrqRouter &) = delete;
	IrqRouter &operator= (const IrqRouter &) = delete;

	const IrqChipLayout &layout() const { return layout_; }

	// Validates a complete table without affecting the one in effect.
	// Later entries for the same GSI replace earlier ones.
	Result<std::shared_ptr<const RoutingTable>> prepare(std::span<const IrqRoute> routes) const;

	void publish(std::shared_ptr<const RoutingTable> table);

	const std::shared_ptr<const RoutingTable> &current() const { return table_; }

	// Records the level of a line. Returns true on a low-to-high transition.
	// Lines stay asserted until the owning device deasserts them.
	bool setLevel(Gsi gsi, bool level);

	bool isAsserted(Gsi gsi) const;

	std::vector<Gsi> assertedLines() const;

	void restoreLevels(std::span<const Gsi> asserted);

private:
	IrqChipLayout layout_;
	std::shared_ptr<const RoutingTable> table_;

	mutable std::mutex levelMutex_;
	std::set<Gsi> asserted_;
};

} // namespace hv
