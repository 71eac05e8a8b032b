#pragma once

#include <atomic>
#include <cstddef>

// Рисует прогресс-бар пакетной обработки, пока completed < total.
// Запускается в отдельном потоке и завершается строкой 100%.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);
