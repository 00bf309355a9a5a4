#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace {
constexpr int kBarWidth = 50;
}

void drawProgressLine(std::ostream& out, std::size_t current, std::size_t total, int width) {
    float progress = total == 0 ? 1.0f : static_cast<float>(current) / total;
    int pos = static_cast<int>(width * progress);

    out << "\r  " << (current >= total ? Color::GREEN : Color::CYAN) << "[";
    for (int i = 0; i < width; ++i) {
        if (i < pos) out << "█";
        else if (i == pos) out << "▒";
        else out << "░";
    }
    out << "] " << Color::BOLD << std::setw(3) << static_cast<int>(progress * 100.0f)
        << "%" << Color::RESET << " (" << current << "/" << total << ")";
    out.flush();
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& finished) {
    while (!finished.load() && completed.load() < total) {
        drawProgressLine(std::cout, completed.load(), total, kBarWidth);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    // Финальное обновление до 100%
    drawProgressLine(std::cout, total, total, kBarWidth);
    std::cout << "\n";
}
