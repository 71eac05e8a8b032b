#pragma once

#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>

namespace ratcalc {

// Строка входного файла с её номером
struct ExpressionLine {
    std::size_t number;
    std::string text;
};

// Вычисляет одну строку и собирает запись для CSV.
// Восстанавливаемые ошибки попадают в запись, фатальные (std::logic_error) пробрасываются.
EvaluationRecord evaluateLine(const ExpressionEvaluator& evaluator, const ExpressionLine& line);

// Потоковая обработка файла: строки читаются порциями по chunkSize и сразу
// отправляются в пул; готовые futures собираются пачками по batchSize
// и передаются в processBatch в порядке постановки.
// Файл не загружается в память целиком.
template <typename ProcessCallback>
void processExpressionsStreaming(
    const std::filesystem::path& path,
    const ExpressionEvaluator& evaluator,
    ThreadPool& pool,
    std::atomic<std::size_t>& completed,
    ProcessCallback&& processBatch,
    std::size_t chunkSize = 10000,
    std::size_t batchSize = 1000) {

    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::vector<ExpressionLine> chunk;
    chunk.reserve(chunkSize);
    std::vector<std::future<EvaluationRecord>> futures;
    futures.reserve(batchSize);

    auto collectBatch = [&]() {
        if (futures.empty()) return;

        std::vector<EvaluationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        futures.clear();
        processBatch(batch);
    };

    auto submitChunk = [&]() {
        for (auto& expressionLine : chunk) {
            futures.emplace_back(pool.enqueue(
                [line = std::move(expressionLine), &evaluator, &completed]() {
                    EvaluationRecord record = evaluateLine(evaluator, line);
                    completed.fetch_add(1);
                    return record;
                }));

            if (futures.size() >= batchSize) {
                collectBatch();
            }
        }
        chunk.clear();
    };

    std::string buffer;
    std::size_t lineNumber = 1;
    while (std::getline(input, buffer)) {
        if (!buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }
        chunk.push_back({ lineNumber++, std::move(buffer) });
        if (chunk.size() >= chunkSize) {
            submitChunk();
        }
    }

    submitChunk();
    collectBatch();
}

} // namespace ratcalc
