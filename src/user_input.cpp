#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {
constexpr std::size_t kMaxThreads = 256;

bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// Печатает подсказку и читает строку ответа без краевых пробелов.
// Конец ввода - ошибка, иначе интерактивный цикл не завершится.
std::string prompt(const std::string& question) {
    std::cout << Color::BOLD << question << Color::RESET;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        throw std::runtime_error("Ввод завершён");
    }
    return trim(answer);
}

// Вариант 1 или 2 из меню выбора имени файла
bool chooseDefaultName(const std::string& defaultDescription) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". " << defaultDescription << "\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = prompt("Ваш выбор (1 или 2): ");
    if (choice == "1") {
        return true;
    }
    if (choice == "2") {
        return false;
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

// Кастомное имя файла с принудительным расширением
std::filesystem::path askCustomName(const std::string& extension) {
    std::string customName = prompt("Введите название файла (расширение " + extension +
                                    " добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    std::filesystem::path customPath(customName);
    if (customPath.extension() != extension) {
        customPath.replace_extension(extension);
    }
    return customPath;
}
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::size_t parseNumber(const std::string& value) {
    // Знак и пробелы std::stoul принял бы молча ("-1" -> SIZE_MAX)
    if (!isAllDigits(value)) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    std::size_t result = 0;
    try {
        std::size_t consumed = 0;
        result = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::filesystem::path selectInputFile() {
    std::filesystem::path dataDir = findDataDirectory();
    auto txtFiles = findTxtFiles(dataDir);

    if (txtFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке tests/data.\n";
        std::cout << "Директория: " << Color::CYAN << dataDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные .txt файлы в папке tests/data:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = prompt("Введите номер файла или путь до входного файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    if (isAllDigits(input) && !txtFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    if (chooseDefaultName("Название по умолчанию (имя входного файла + _results_ + время)")) {
        return inputPath.parent_path() /
            (inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv");
    }

    std::filesystem::path customPath = askCustomName(".csv");
    // Относительный путь считается от директории входного файла
    if (customPath.is_absolute()) {
        return customPath;
    }
    return inputPath.parent_path() / customPath;
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2;
    }

    std::string input = prompt("Введите количество потоков (по умолчанию: " +
                               std::to_string(defaultThreads) + "): ");
    if (input.empty()) {
        return defaultThreads;
    }
    std::size_t threads = parseNumber(input);
    if (threads > kMaxThreads) {
        throw std::runtime_error("Слишком много потоков (максимум " + std::to_string(kMaxThreads) + ")");
    }
    return threads;
}

bool askContinue() {
    std::string input;
    try {
        input = prompt("Обработать еще один файл? (y/n): ");
    }
    catch (const std::runtime_error&) {
        return false; // Конец ввода
    }
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    return input == "y" || input == "yes" || input == "д" || input == "да";
}

std::size_t askExpressionCount() {
    std::string input = prompt("Введите количество выражений для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t expressionCount) {
    if (chooseDefaultName("Автоматическое название (generate_" + std::to_string(expressionCount) + ".txt)")) {
        return std::filesystem::path("generate_" + std::to_string(expressionCount) + ".txt");
    }
    return askCustomName(".txt");
}
