#pragma once

#include <filesystem>
#include <cstddef>
#include <string>

// Удаляет пробелы и табуляции по краям строки
std::string trim(const std::string& text);

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Интерактивный выбор входного файла (номер из tests/data или путь)
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного CSV файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества выражений для генерации
std::size_t askExpressionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t expressionCount);
