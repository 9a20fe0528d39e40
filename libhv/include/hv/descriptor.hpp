#pragma once

#include <utility>

namespace hv {

// Owns a host file descriptor (the KVM device, a VM, a vCPU, an eventfd).
struct UniqueFd {
	friend void swap(UniqueFd &a, UniqueFd &b) {
		using std::swap;
		swap(a.fd_, b.fd_);
	}

	UniqueFd() : fd_{-1} { }

	explicit UniqueFd(int fd) : fd_{fd} { }

	UniqueFd(const UniqueFd &) = delete;

	UniqueFd(UniqueFd &&other) : UniqueFd() { swap(*this, other); }

	~UniqueFd();

	UniqueFd &operator= (UniqueFd other) {
		swap(*this, other);
		return *this;
	}

	explicit operator bool () const { return fd_ >= 0; }

	int get() const { return fd_; }

private:
	int fd_;
};

} // namespace hv
