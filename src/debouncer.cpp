#include "debouncer.hpp"

namespace uhf {

bool Debouncer::accept(const TagDetection& det, TimePoint now) {
	std::lock_guard<std::mutex> lk(mu_);
	const std::string& id = det.epc_hex.empty() ? hex(det.epc) : det.epc_hex;

	auto it = seen_.find(id);
	if (it != seen_.end()) {
		if (window_.count() > 0 && now - it->second.last <= window_) return false;
		it->second.last = now;
		order_.splice(order_.begin(), order_, it->second.lru);
		return true;
	}

	order_.push_front(id);
	seen_.emplace(id, Entry{ now, order_.begin() });
	if (max_entries_ > 0 && seen_.size() > max_entries_) {
		seen_.erase(order_.back());
		order_.pop_back();
	}
	return true;
}

void Debouncer::reset() {
	std::lock_guard<std::mutex> lk(mu_);
	seen_.clear();
	order_.clear();
}

size_t Debouncer::size() const {
	std::lock_guard<std::mutex> lk(mu_);
	return seen_.size();
}

void Debouncer::set_window(Millis w) {
	std::lock_guard<std::mutex> lk(mu_);
	window_ = w;
}

} // namespace uhf
