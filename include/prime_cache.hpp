#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace ratcalc {

// Кэш простых чисел, общий для всех вычислений НОД в процессе.
// Последовательность только растёт: строго возрастающая, без повторов, первый элемент всегда 2.
// Доступ сериализован мьютексом, поэтому кэш можно использовать из нескольких потоков.
class PrimeCache {
public:
    PrimeCache() = default;

    PrimeCache(const PrimeCache&) = delete;
    PrimeCache& operator=(const PrimeCache&) = delete;

    // Глобальный экземпляр. Создаётся лениво при первом обращении
    // и живёт до завершения процесса.
    static PrimeCache& instance();

    // Возвращает простое число с номером index (0 -> 2, 1 -> 3, ...).
    // Если число ещё не найдено, кэш расширяется пробным делением.
    std::uint64_t at(std::size_t index);

    // Количество уже найденных простых чисел
    std::size_t size() const;

private:
    mutable std::mutex mutex;
    std::vector<std::uint64_t> primes;

    // Находит следующее простое число после последнего в кэше.
    // Вызывается только под блокировкой.
    std::uint64_t findNext() const;
};

} // namespace ratcalc
