#include "batch_mode.hpp"
#include "console.hpp"
#include "expression_processor.hpp"
#include "file_utils.hpp"
#include "progress_bar.hpp"
#include "user_input.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <thread>

namespace ratcalc {

BatchSummary evaluateFile(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath,
                          std::size_t threadCount,
                          std::atomic<std::size_t>& completed) {
    ExpressionEvaluator evaluator;
    CsvWriter writer(outputPath);
    BatchSummary summary;

    // Пачки приходят в порядке постановки, но буфер по номеру строки
    // гарантирует порядок записи и при другом порядке сборки
    std::map<std::size_t, EvaluationRecord> pending;
    std::size_t nextLineToWrite = 1;

    auto processBatch = [&](const std::vector<EvaluationRecord>& batch) {
        for (const auto& record : batch) {
            ++summary.total;
            if (record.succeeded()) {
                ++summary.succeeded;
            } else {
                ++summary.failed;
            }
            pending.emplace(record.lineNumber, record);
        }

        for (auto it = pending.find(nextLineToWrite); it != pending.end();
             it = pending.find(nextLineToWrite)) {
            writer.writeRecord(it->second);
            pending.erase(it);
            ++nextLineToWrite;
        }
    };

    {
        ThreadPool pool(threadCount);
        processExpressionsStreaming(inputPath, evaluator, pool, completed, processBatch);
    }

    for (const auto& [lineNumber, record] : pending) {
        writer.writeRecord(record);
    }
    writer.flush();
    return summary;
}

} // namespace ratcalc

void runBatchMode() {
    printHeader();
    std::cout << Color::BOLD << Color::CYAN << "Пакетная обработка файла\n" << Color::RESET << "\n";

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            std::filesystem::path inputPath = selectInputFile();
            std::filesystem::path outputPath = selectOutputFile(inputPath);
            std::size_t threadCount = selectThreadCount();

            std::cout << "\n";
            std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
            std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
            std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
            std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n\n";

            std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
            auto startCount = std::chrono::steady_clock::now();
            std::size_t totalLines = countLinesInFile(inputPath);
            auto countDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startCount);
            std::cout << " " << Color::GREEN << "✓" << Color::RESET << " ("
                << totalLines << " строк, " << countDuration.count() << " мс)\n\n";

            std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
            auto startProcess = std::chrono::steady_clock::now();

            std::atomic<std::size_t> completed{ 0 };
            std::thread progressThread(displayProgress, std::cref(completed), totalLines);

            ratcalc::BatchSummary summary;
            try {
                summary = ratcalc::evaluateFile(inputPath, outputPath, threadCount, completed);
            }
            catch (...) {
                // Останавливаем прогресс-бар перед выходом из области видимости потока
                completed.store(totalLines);
                progressThread.join();
                throw;
            }
            // Файл мог измениться между подсчетом и чтением
            completed.store(std::max(completed.load(), totalLines));
            progressThread.join();

            auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startProcess);

            std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
            std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
            std::cout << "  Успешно:          " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
            if (summary.failed > 0) {
                std::cout << "  Ошибок:           " << Color::RED << summary.failed << Color::RESET << "\n";
            }
            std::cout << "  Время обработки:  " << Color::MAGENTA << processDuration.count()
                << " мс" << Color::RESET << "\n";
            if (processDuration.count() > 0) {
                std::cout << "  Производительность: " << Color::YELLOW
                    << static_cast<long long>(summary.total * 1000.0 / processDuration.count())
                    << " выр/сек" << Color::RESET << "\n";
            }
            std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << outputPath
                << Color::RESET << "\n\n";
        }
        catch (const std::runtime_error& ex) {
            printError(ex.what());
        }

        continueProcessing = askContinue();
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
}
