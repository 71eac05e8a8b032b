#include <iostream>
#include <stdexcept>
#include <string>

#include "batch_mode.hpp"
#include "console.hpp"
#include "evaluator.hpp"
#include "generate_mode.hpp"
#include "repl.hpp"

// Точка входа в программу.
//   ratcalc           - построчное вычисление stdin, результат в stdout
//   ratcalc batch     - пакетная обработка файла с CSV отчётом
//   ratcalc generate  - генерация файла с выражениями
// Фатальные ошибки (std::logic_error) не перехватываются и завершают процесс.
int main(int argc, char** argv) {
    std::string mode = argc >= 2 ? argv[1] : "";

    if (mode.empty()) {
        ratcalc::ExpressionEvaluator evaluator;
        ratcalc::runLines(std::cin, std::cout, evaluator);
        return 0;
    }

    try {
        if (mode == "batch") {
            runBatchMode();
            return 0;
        }
        if (mode == "generate") {
            runGenerateMode();
            return 0;
        }
        throw std::runtime_error("Неизвестный режим '" + mode + "'. Используйте batch или generate");
    }
    catch (const std::runtime_error& ex) {
        printError(ex.what());
        return 1;
    }
}
