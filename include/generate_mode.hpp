#pragma once

#include <cstddef>
#include <filesystem>

#include "expression_generator.hpp"

namespace ratcalc {

// Записывает count сгенерированных выражений в outputPath, по одному на строку.
// Количество операндов чередуется от 2 до 6.
void writeGeneratedExpressions(ExpressionGenerator& generator,
                               const std::filesystem::path& outputPath,
                               std::size_t count);

} // namespace ratcalc

// Интерактивный режим генерации выражений в tests/data
void runGenerateMode();
