#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Количество строк в файле (последняя строка без \n тоже считается)
std::size_t countLinesInFile(const std::filesystem::path& path);

// Корень проекта: первый предок текущей директории с папкой tests или файлом CMakeLists.txt
std::filesystem::path findProjectRoot();

// Папка с файлами выражений: <корень проекта>/tests/data
std::filesystem::path findDataDirectory();

// Все .txt файлы директории (без рекурсии), отсортированные по имени
std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory);

// Текущее время в формате YYYYmmdd_HHMMSS для имён файлов
std::string getCurrentTimeString();
