#include "prime_cache.hpp"

namespace ratcalc {

PrimeCache& PrimeCache::instance() {
    static PrimeCache cache;
    return cache;
}

std::uint64_t PrimeCache::at(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex);
    if (primes.empty()) {
        primes.push_back(2);
    }

    // Последовательность обходится с нуля, поэтому запрошенный индекс
    // не больше чем на единицу превышает последний найденный
    while (index >= primes.size()) {
        primes.push_back(findNext());
    }
    return primes[index];
}

std::size_t PrimeCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return primes.size();
}

std::uint64_t PrimeCache::findNext() const {
    for (std::uint64_t candidate = primes.back() + 1;; ++candidate) {
        bool isPrime = true;
        for (std::uint64_t prime : primes) {
            if (prime * prime > candidate) {
                break;
            }
            if (candidate % prime == 0) {
                isPrime = false;
                break;
            }
        }
        if (isPrime) {
            return candidate;
        }
    }
}

} // namespace ratcalc
