#pragma once
#include <cstdio>
#include <string_view>

namespace taskpool::utils {

    // The handful of cursor operations StatusLines needs.
    class ITerminal {
    public:
        virtual ~ITerminal() = default;

        virtual int cursor_row() = 0;   // 1-based row of the cursor in the window
        virtual int height() = 0;       // rows in the window
        virtual void write(std::string_view s) = 0;
        virtual void move_down(int n) = 0;
        virtual void move_up(int n) = 0;
        virtual void erase_line() = 0;
        virtual void flush() {}
    };

    // VT100 terminal on a stdio stream. The cursor row is asked from the
    // terminal itself (DSR) through /dev/tty; when that is not possible the
    // cursor is assumed to sit on the last row, which is where it is while
    // output scrolls.
    class AnsiTerminal : public ITerminal {
    public:
        explicit AnsiTerminal(std::FILE* out = stdout);
        ~AnsiTerminal() override;

        AnsiTerminal(const AnsiTerminal&) = delete;
        AnsiTerminal& operator=(const AnsiTerminal&) = delete;

        int cursor_row() override;
        int height() override;
        void write(std::string_view s) override;
        void move_down(int n) override;
        void move_up(int n) override;
        void erase_line() override;
        void flush() override;

        bool is_tty() const { return is_tty_; }

    private:
        bool query_cursor(int& row);

        std::FILE* out_;
        int tty_fd_ = -1;
        bool is_tty_ = false;
    };

} // namespace taskpool::utils
