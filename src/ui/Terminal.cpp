#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <stdexcept>
#include <unistd.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <fcntl.h>
#include <csignal>
#include <cerrno>
#include <poll.h>

namespace rdu::ui {

namespace {

// Never call ioctl or take locks in a handler, only set flags
volatile std::sig_atomic_t g_resize_pending = 0;

// Saved state for emergency_restore(), which cannot touch the instance
::termios g_original_termios;
int g_original_stdin_flags = 0;
volatile std::sig_atomic_t g_raw_mode_active = 0;

constexpr char RESTORE_SEQUENCE[] = "\033[0m\033[?25h\033[?1049l";

void sigwinch_handler(int) {
    g_resize_pending = 1;
}

InputEvent key(int code, std::string name) {
    return {InputEvent::Type::KeyPress, code, std::move(name)};
}

// Next byte from non-blocking stdin, -1 if none
int read_byte() {
    unsigned char c;
    ssize_t n;
    do {
        n = ::read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1 ? c : -1;
}

}  // namespace

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::Terminal() {}
Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) {
        throw std::runtime_error("stdin and stdout must be a terminal");
    }

    if (::tcgetattr(STDIN_FILENO, &g_original_termios) != 0) {
        throw std::runtime_error("tcgetattr failed: " + util::Platform::error_string(errno));
    }

    ::termios raw = g_original_termios;
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN);  // ISIG stays on so Ctrl+C still signals
    raw.c_iflag &= ~(IXON | ICRNL);            // Disable flow control and CR->NL
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        throw std::runtime_error("tcsetattr failed: " + util::Platform::error_string(errno));
    }

    g_original_stdin_flags = ::fcntl(STDIN_FILENO, F_GETFL, 0);
    ::fcntl(STDIN_FILENO, F_SETFL, g_original_stdin_flags | O_NONBLOCK);
    g_raw_mode_active = 1;

    // No SA_RESTART: poll() in the main loop should wake up on resize
    struct sigaction sa {};
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGWINCH, &sa, nullptr);

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h"); // Enter alternate screen buffer
    write_raw("\033[?25l");   // Hide cursor
    initialized_ = true;
    util::Logger::debug("Terminal: Raw mode on");
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[0m\033[?25h");  // Reset attributes, show cursor
    write_raw("\033[?1049l");       // Exit alternate screen buffer

    // Stop writer thread after it drained the queue
    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_original_termios);
    ::fcntl(STDIN_FILENO, F_SETFL, g_original_stdin_flags);
    g_raw_mode_active = 0;

    initialized_ = false;
    util::Logger::debug("Terminal: Restored");
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::emergency_restore() noexcept {
    if (!g_raw_mode_active) return;
    g_raw_mode_active = 0;

    ssize_t ignored = ::write(STDOUT_FILENO, RESTORE_SEQUENCE, sizeof(RESTORE_SEQUENCE) - 1);
    (void)ignored;
    ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_original_termios);
    ::fcntl(STDIN_FILENO, F_SETFL, g_original_stdin_flags);
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) {
                break;  // stopped and drained
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
            writing_ = true;
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = ::write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0) {
                if (errno == EINTR) continue;

                // stdout may share the non-blocking file description with stdin
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                    ::poll(&pfd, 1, 100);
                    continue;
                }

                util::Logger::error("Terminal: Write failed: " + util::Platform::error_string(errno));
                break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            writing_ = false;
            if (write_queue_.empty()) {
                drained_cv_.notify_all();
            }
        }
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    drained_cv_.notify_all();
}

void Terminal::write_raw(std::string text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(std::move(text));
    }
    queue_cv_.notify_one();
}

void Terminal::flush() {
    if (!running_) return;
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return (write_queue_.empty() && !writing_) || !running_; });
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

bool Terminal::consume_resize() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return true;
    }
    return false;
}

InputEvent Terminal::read_escape_sequence() {
    int c = read_byte();
    if (c < 0) {
        return key(27, "escape");
    }

    if (c == 'O') {
        // SS3 form used by some terminals for Home/End and arrows
        switch (read_byte()) {
            case 'A': return key(0, "up");
            case 'B': return key(0, "down");
            case 'C': return key(0, "right");
            case 'D': return key(0, "left");
            case 'H': return key(0, "home");
            case 'F': return key(0, "end");
        }
        return {};
    }

    if (c != '[') {
        return {};  // Alt+key, not bound
    }

    // CSI: optional numeric parameter, then a final byte
    int param = 0;
    int b = read_byte();
    while (b >= '0' && b <= '9') {
        param = param * 10 + (b - '0');
        b = read_byte();
    }
    // Skip modifier parameters such as "1;5"
    while (b == ';' || (b >= '0' && b <= '9')) {
        b = read_byte();
    }

    switch (b) {
        case 'A': return key(0, "up");
        case 'B': return key(0, "down");
        case 'C': return key(0, "right");
        case 'D': return key(0, "left");
        case 'H': return key(0, "home");
        case 'F': return key(0, "end");
        case '~':
            switch (param) {
                case 1: case 7: return key(0, "home");
                case 4: case 8: return key(0, "end");
                case 3: return key(0, "delete");
                case 5: return key(0, "pageup");
                case 6: return key(0, "pagedown");
            }
            break;
    }
    util::Logger::debug("Terminal: Unhandled escape sequence, param=" + std::to_string(param));
    return {};
}

InputEvent Terminal::read_input() {
    if (consume_resize()) {
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    int c = read_byte();
    if (c < 0) {
        return {};
    }

    if (c == 27) {
        return read_escape_sequence();
    }
    if (c == '\n' || c == '\r') {
        return key(c, "enter");
    }
    if (c == 127 || c == 8) {
        return key(c, "backspace");
    }
    if (c == '\t') {
        return key(c, "tab");
    }
    if (c >= 1 && c <= 26) {
        return key(c, std::string("ctrl+") + static_cast<char>('a' + c - 1));
    }
    if (c == ' ') {
        return key(c, "space");
    }

    return key(c, std::string(1, static_cast<char>(c)));
}

int Terminal::get_terminal_width() const {
    winsize w {};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) {
        return 80;
    }
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w {};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_row == 0) {
        return 24;
    }
    return w.ws_row;
}

}  // namespace rdu::ui
