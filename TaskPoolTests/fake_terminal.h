#pragma once
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "Utils/Terminal.h"

namespace tests {

    // In-memory terminal: a scrollback buffer plus a window of `height` rows
    // at its bottom. Writing a newline on the last row scrolls the window.
    class FakeTerminal : public taskpool::utils::ITerminal {
    public:
        explicit FakeTerminal(int height, int start_row = 1) : height_(height) {
            lines_.resize(static_cast<size_t>(start_row));
            cur_ = static_cast<size_t>(start_row - 1);
        }

        int cursor_row() override { return static_cast<int>(cur_ - top_) + 1; }
        int height() override { return height_; }

        void write(std::string_view s) override {
            for (char c : s) {
                if (c == '\n') newline();
                else lines_[cur_] += c;
            }
        }
        void move_down(int n) override {
            cur_ = std::min(cur_ + static_cast<size_t>(n), top_ + static_cast<size_t>(height_) - 1);
            if (lines_.size() <= cur_) lines_.resize(cur_ + 1);
        }
        void move_up(int n) override {
            cur_ = cur_ >= top_ + static_cast<size_t>(n) ? cur_ - static_cast<size_t>(n) : top_;
        }
        void erase_line() override { lines_[cur_].clear(); }

        // row is 1-based within the window
        std::string row(int r) const {
            const size_t i = top_ + static_cast<size_t>(r - 1);
            return i < lines_.size() ? lines_[i] : std::string();
        }
        const std::vector<std::string>& buffer() const { return lines_; }
        size_t scrolled() const { return top_; }

    private:
        void newline() {
            ++cur_;
            if (lines_.size() <= cur_) lines_.resize(cur_ + 1);
            if (cur_ - top_ + 1 > static_cast<size_t>(height_)) ++top_;
        }

        int height_;
        std::vector<std::string> lines_;
        size_t cur_{ 0 };
        size_t top_{ 0 };
    };

} // namespace tests
