#pragma once

#include "ui/InputEvent.hpp"
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>

#ifdef __linux__
#include <termios.h>
#endif

namespace rdu::ui {

class Terminal {
public:
    static Terminal& instance();

    // Raw mode + alternate screen. Throws std::runtime_error when stdin is
    // not a terminal or its attributes cannot be changed.
    void init();
    void shutdown();
    bool is_initialized() const;

    void clear_screen();

    // Enqueue raw data for asynchronous writing to stdout
    void write_raw(std::string text);

    // Block until the writer thread has drained the queue
    void flush();

    // Next key from stdin (non-blocking); Type::None when nothing is pending
    InputEvent read_input();

    // True once after each SIGWINCH
    bool consume_resize();

    int get_terminal_width() const;
    int get_terminal_height() const;

    // Leave raw mode and the alternate screen using only async-signal-safe
    // calls. Safe to call from signal handlers and std::terminate.
    static void emergency_restore() noexcept;

private:
    Terminal();
    ~Terminal();

    void writer_loop();
    InputEvent read_escape_sequence();

    bool initialized_ = false;

    // Async writer components
    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<std::string> write_queue_;
    bool writing_ = false;
    std::atomic<bool> running_{false};
};

}  // namespace rdu::ui
