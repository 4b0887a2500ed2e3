#include "Terminal.h"
#include "Log.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace taskpool::utils {

    AnsiTerminal::AnsiTerminal(std::FILE* out)
        : out_(out ? out : stdout)
    {
        is_tty_ = ::isatty(::fileno(out_)) == 1;
        if (is_tty_) {
            tty_fd_ = ::open("/dev/tty", O_RDWR | O_NOCTTY | O_CLOEXEC);
            if (tty_fd_ < 0) TPLOGD("no /dev/tty (%s), cursor row queries disabled", std::strerror(errno));
        }
    }

    AnsiTerminal::~AnsiTerminal() {
        if (tty_fd_ >= 0) ::close(tty_fd_);
    }

    int AnsiTerminal::height() {
        winsize ws{};
        if (::ioctl(::fileno(out_), TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) return ws.ws_row;
        if (tty_fd_ >= 0 && ::ioctl(tty_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) return ws.ws_row;
        return 24;
    }

    int AnsiTerminal::cursor_row() {
        int row = 0;
        if (query_cursor(row)) return row;
        return height();
    }

    // ESC[6n -> ESC[<row>;<col>R, read back with echo and line buffering off
    bool AnsiTerminal::query_cursor(int& row) {
        if (tty_fd_ < 0) return false;
        std::fflush(out_);

        termios saved{};
        if (::tcgetattr(tty_fd_, &saved) != 0) return false;
        termios raw = saved;
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        if (::tcsetattr(tty_fd_, TCSANOW, &raw) != 0) return false;

        bool ok = false;
        char buf[32]{};
        size_t len = 0;
        if (::write(tty_fd_, "\x1b[6n", 4) == 4) {
            pollfd pfd{ tty_fd_, POLLIN, 0 };
            while (len + 1 < sizeof(buf) && ::poll(&pfd, 1, 100) > 0) {
                char c = 0;
                if (::read(tty_fd_, &c, 1) != 1) break;
                buf[len++] = c;
                if (c == 'R') { ok = true; break; }
            }
        }
        ::tcsetattr(tty_fd_, TCSANOW, &saved);
        if (!ok) return false;

        int r = 0, col = 0;
        const char* esc = std::strchr(buf, '\x1b');
        if (!esc || std::sscanf(esc, "\x1b[%d;%dR", &r, &col) != 2) return false;
        row = r;
        return true;
    }

    void AnsiTerminal::write(std::string_view s) {
        std::fwrite(s.data(), 1, s.size(), out_);
    }

    void AnsiTerminal::move_down(int n) {
        if (n > 0) std::fprintf(out_, "\x1b[%dB", n);
    }

    void AnsiTerminal::move_up(int n) {
        if (n > 0) std::fprintf(out_, "\x1b[%dA", n);
    }

    void AnsiTerminal::erase_line() {
        std::fputs("\r\x1b[2K", out_);
    }

    void AnsiTerminal::flush() {
        std::fflush(out_);
    }

} // namespace taskpool::utils
