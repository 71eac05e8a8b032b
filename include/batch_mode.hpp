#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>

namespace ratcalc {

// Итоги пакетной обработки одного файла
struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Вычисляет все строки inputPath на threadCount потоках и пишет CSV в outputPath
// в порядке строк входного файла. completed увеличивается по мере готовности строк.
BatchSummary evaluateFile(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath,
                          std::size_t threadCount,
                          std::atomic<std::size_t>& completed);

} // namespace ratcalc

// Интерактивный пакетный режим: выбор файла, CSV отчёт, статистика.
// Повторяется, пока пользователь соглашается обработать ещё один файл.
void runBatchMode();
