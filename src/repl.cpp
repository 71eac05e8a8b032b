#include "repl.hpp"

#include <string>

namespace ratcalc {

namespace {
// Строгая проверка UTF-8: без overlong-форм, суррогатов и кодов выше U+10FFFF
bool isValidUtf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;

        if (lead < 0x80) {
            ++i;
            continue;
        }
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        }
        else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        }
        else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        }
        else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if (next < (k == 1 ? low : 0x80) || next > (k == 1 ? high : 0xBF)) {
                return false;
            }
        }
        i += length;
    }
    return true;
}
}

std::size_t runLines(std::istream& input, std::ostream& output, const ExpressionEvaluator& evaluator) {
    std::size_t processed = 0;
    std::string line;
    while (std::getline(input, line)) {
        // Строка не в UTF-8 считается ошибкой чтения и завершает ввод
        if (!isValidUtf8(line)) {
            break;
        }
        // Окончание строки в стиле Windows
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        output << evaluator.report(line) << '\n';
        ++processed;
    }
    output.flush();
    return processed;
}

} // namespace ratcalc
