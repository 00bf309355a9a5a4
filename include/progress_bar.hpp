#pragma once

#include <atomic>
#include <cstddef>
#include <iosfwd>

// Отображение прогресс-бара, пока completed < total и не выставлен finished.
// Запускается в отдельном потоке; перерисовывает строку раз в 50 мс.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& finished);

// Одна строка прогресс-бара шириной width символов
void drawProgressLine(std::ostream& out, std::size_t current, std::size_t total, int width);
