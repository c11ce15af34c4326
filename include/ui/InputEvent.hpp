#pragma once

#include <string>

namespace rdu::ui {

struct InputEvent {
    enum class Type {
        None,
        KeyPress,
        Resize
    };

    Type type = Type::None;
    int key = 0;          // byte value for printable and control keys, 0 for named keys
    std::string key_name; // "up", "pagedown", "enter", "ctrl+d", "a", "G", etc.

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }

    bool empty() const { return type == Type::None; }
};

} // namespace rdu::ui
