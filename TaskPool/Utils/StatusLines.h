#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "Terminal.h"

namespace taskpool::utils {

    // Redraws numbered "virtual" lines in place, even after lines below them
    // were printed. Virtual line 0 is the line the cursor sat on when the
    // session started (or was last reset). Between writes the cursor rests on
    // the empty line below the lowest line printed so far.
    //
    // Each session tracks its own lowest line, so independent renderers can
    // coexist. Thread-safe.
    class StatusLines {
    public:
        explicit StatusLines(std::shared_ptr<ITerminal> term);
        StatusLines();  // ANSI terminal on stdout

        // Writes `text` on virtual line `line`. Returns false when the line has
        // already scrolled above the window (or is negative) and nothing was drawn.
        bool set_line(int line, std::string_view text);

        // Restart virtual numbering at 0 on the cursor's current line.
        void reset();

        std::optional<int> lowest_printed_line() const;

    private:
        std::shared_ptr<ITerminal> term_;
        mutable std::mutex mu_;
        std::optional<int> lowest_;
    };

} // namespace taskpool::utils
