#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace {
constexpr int kBarWidth = 50;

void drawBar(std::size_t current, std::size_t total, const char* color) {
    double progress = total == 0 ? 1.0 : static_cast<double>(current) / total;
    int filled = static_cast<int>(kBarWidth * progress);

    std::cout << "\r  " << color << "[";
    for (int i = 0; i < kBarWidth; ++i) {
        if (i < filled) std::cout << "█";
        else if (i == filled) std::cout << "▒";
        else std::cout << "░";
    }
    std::cout << "] " << Color::BOLD << std::setw(3) << static_cast<int>(progress * 100.0)
        << "%" << Color::RESET << " (" << current << "/" << total << ")";
    std::cout.flush();
}
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total) {
    while (completed.load() < total) {
        drawBar(completed.load(), total, Color::CYAN);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    drawBar(total, total, Color::GREEN);
    std::cout << "\n";
}
