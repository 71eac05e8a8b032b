#include "generate_mode.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "user_input.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ratcalc {

void writeGeneratedExpressions(ExpressionGenerator& generator,
                               const std::filesystem::path& outputPath,
                               std::size_t count) {
    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    for (std::size_t i = 0; i < count; ++i) {
        output << generator.generate(2 + i % 5) << '\n';

        // Прогресс для больших файлов
        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << count
                << " выражений сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.flush();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }
}

} // namespace ratcalc

void runGenerateMode() {
    printHeader();
    std::cout << Color::BOLD << Color::CYAN << "Режим генерации выражений\n" << Color::RESET << "\n";

    std::size_t expressionCount = askExpressionCount();
    std::filesystem::path fileName = selectGeneratedFileName(expressionCount);

    std::filesystem::path dataDir = findDataDirectory();
    std::filesystem::create_directories(dataDir);
    std::filesystem::path outputPath = dataDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество выражений: " << Color::CYAN << expressionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:        " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    auto start = std::chrono::steady_clock::now();

    ratcalc::ExpressionGenerator generator;
    ratcalc::writeGeneratedExpressions(generator, outputPath, expressionCount);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << expressionCount << " выражений, " << duration.count() << " мс)\n\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
