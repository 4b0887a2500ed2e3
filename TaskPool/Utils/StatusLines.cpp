#include "StatusLines.h"

#include <algorithm>
#include <string>

namespace taskpool::utils {

    StatusLines::StatusLines(std::shared_ptr<ITerminal> term)
        : term_(std::move(term)) {}

    StatusLines::StatusLines()
        : term_(std::make_shared<AnsiTerminal>(stdout)) {}

    bool StatusLines::set_line(int line, std::string_view text)
    {
        if (line < 0) return false;
        std::lock_guard<std::mutex> lk(mu_);

        // downward offset from the cursor's virtual position to the target line
        const int dy = line - (lowest_ ? *lowest_ + 1 : 0);
        const int y = term_->cursor_row();

        // already scrolled off the top
        if (y + dy < 1) return false;

        const int height = term_->height();
        if (y + dy >= height) {
            // below the window: grow the buffer
            for (int i = 0; i < dy; ++i) term_->write("\n");
        }
        else if (dy > 0) term_->move_down(dy);
        else if (dy < 0) term_->move_up(-dy);

        term_->erase_line();
        std::string out(text);
        out += '\n';
        term_->write(out);

        lowest_ = std::max(lowest_.value_or(line), line);

        // back to the line after the lowest one
        if (line < *lowest_) term_->move_down(*lowest_ - line);
        term_->flush();
        return true;
    }

    void StatusLines::reset()
    {
        std::lock_guard<std::mutex> lk(mu_);
        lowest_.reset();
    }

    std::optional<int> StatusLines::lowest_printed_line() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return lowest_;
    }

} // namespace taskpool::utils
