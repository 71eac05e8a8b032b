#include "csv_writer.hpp"

#include <stdexcept>

namespace ratcalc {

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : path(std::move(targetPath)), stream(path, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,result,message\n";
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << record.lineNumber << ','
           << quote(record.expression) << ','
           << record.status << ',';
    if (record.value.has_value()) {
        stream << record.value->toString();
    }
    stream << ',' << quote(record.message) << '\n';

    if (!stream) {
        throw std::runtime_error("Ошибка записи в CSV файл: " + path.string());
    }
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
    flush();
}

void CsvWriter::flush() {
    stream.flush();
    if (!stream) {
        throw std::runtime_error("Ошибка записи в CSV файл: " + path.string());
    }
}

std::string CsvWriter::quote(const std::string& text) {
    std::string sanitized = text;
    for (char& ch : sanitized) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + sanitized + '"';
}

} // namespace ratcalc
