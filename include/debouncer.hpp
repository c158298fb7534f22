#pragma once
#include "common.hpp"
#include <list>
#include <mutex>
#include <unordered_map>

namespace uhf {

/**
* Debouncer
* - 같은 식별자의 반복 검출을 window 동안 억제. I/O 없음.
* - 처음 보거나 now - last_accepted > window 이면 통과하고 기록 갱신.
* - window 0 → 모든 검출 통과.
* - max_entries > 0 이면 LRU로 오래된 식별자부터 제거.
*/
class Debouncer {
public:
	explicit Debouncer(Millis window = Millis(0), size_t max_entries = 0)
		: window_(window), max_entries_(max_entries) {}

	bool accept(const TagDetection& det, TimePoint now);
	bool accept(const TagDetection& det) { return accept(det, Clock::now()); }

	void reset();
	size_t size() const;

	Millis window() const { return window_; }
	void set_window(Millis w);

private:
	struct Entry {
		TimePoint last;
		std::list<std::string>::iterator lru;
	};

	Millis window_;
	size_t max_entries_;
	std::unordered_map<std::string, Entry> seen_;
	std::list<std::string> order_; ///< 앞쪽이 최근
	mutable std::mutex mu_;
};

} // namespace uhf
