#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "rational.hpp"

namespace ratcalc {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber = 0;     // Номер строки (с 1)
    std::string expression;         // Исходный текст
    std::optional<Rational> value;  // Значение, если вычисление успешно
    std::string status;             // "success" или "error"
    std::string message;            // Отчёт об ошибке, например "Err(InvalidSyntax(2))"

    bool succeeded() const { return value.has_value(); }
};

// Запись результатов в CSV: line,expression,status,result,message
// Текстовые поля берутся в кавычки, двойные кавычки внутри заменяются одинарными.
class CsvWriter {
public:
    // Создаёт (перезаписывает) файл и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    void writeRecord(const EvaluationRecord& record);
    void write(const std::vector<EvaluationRecord>& records);
    void flush();

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path;
    std::ofstream stream;

    static std::string quote(const std::string& text);
};

} // namespace ratcalc
