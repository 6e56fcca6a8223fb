#pragma once

#include <glm/glm.hpp>

namespace loom {

enum class InputEventType {
    PointerDown,
    PointerUp,
    PointerMove,
    Wheel,
    KeyDown
};

// One sample of the host's ordered input stream. Movement is relative (raw
// deltas), so it stays meaningful while the pointer is captured.
struct InputEvent {
    InputEventType type = InputEventType::PointerMove;
    float clientX = 0.0f;
    float clientY = 0.0f;
    float movementX = 0.0f;
    float movementY = 0.0f;
    int button = -1;
    float wheelDelta = 0.0f;
    bool shiftKey = false;
    bool ctrlKey = false;
    bool altKey = false;
    bool metaKey = false;
    int key = 0;                // Input::KEY_* code for KeyDown

    static InputEvent pointerMove(float dx, float dy, float x = 0.0f, float y = 0.0f) {
        InputEvent e;
        e.type = InputEventType::PointerMove;
        e.movementX = dx;
        e.movementY = dy;
        e.clientX = x;
        e.clientY = y;
        return e;
    }

    static InputEvent pointerDown(int button, float x = 0.0f, float y = 0.0f) {
        InputEvent e;
        e.type = InputEventType::PointerDown;
        e.button = button;
        e.clientX = x;
        e.clientY = y;
        return e;
    }

    static InputEvent wheel(float delta, bool ctrl = false) {
        InputEvent e;
        e.type = InputEventType::Wheel;
        e.wheelDelta = delta;
        e.ctrlKey = ctrl;
        return e;
    }

    static InputEvent keyDown(int key, bool shift = false) {
        InputEvent e;
        e.type = InputEventType::KeyDown;
        e.key = key;
        e.shiftKey = shift;
        return e;
    }

    glm::vec2 getClientPosition() const { return {clientX, clientY}; }
    glm::vec2 getMovement() const { return {movementX, movementY}; }
};

// Button and key codes (match GLFW)
class Input {
public:
    static constexpr int MOUSE_LEFT = 0;
    static constexpr int MOUSE_RIGHT = 1;
    static constexpr int MOUSE_MIDDLE = 2;

    static constexpr int KEY_A = 65;
    static constexpr int KEY_E = 69;
    static constexpr int KEY_G = 71;
    static constexpr int KEY_I = 73;
    static constexpr int KEY_R = 82;
    static constexpr int KEY_S = 83;
    static constexpr int KEY_X = 88;
    static constexpr int KEY_Y = 89;
    static constexpr int KEY_Z = 90;
    static constexpr int KEY_ESCAPE = 256;
    static constexpr int KEY_ENTER = 257;
    static constexpr int KEY_TAB = 258;
    static constexpr int KEY_DELETE = 261;

    // Component mode shortcuts
    static constexpr int KEY_1 = 49;
    static constexpr int KEY_2 = 50;
    static constexpr int KEY_3 = 51;
};

// Exclusive hold on the pointer for unbounded relative drags. Held only for the
// lifetime of one operation.
class PointerCapture {
public:
    virtual ~PointerCapture() = default;

    virtual bool acquire() = 0;
    virtual void release() = 0;
    virtual bool isAcquired() const = 0;
};

// Headless hosts and tests: capture always succeeds and is only recorded
class NullPointerCapture : public PointerCapture {
public:
    bool acquire() override {
        m_acquired = true;
        m_acquireCount++;
        return true;
    }
    void release() override { m_acquired = false; }
    bool isAcquired() const override { return m_acquired; }

    int getAcquireCount() const { return m_acquireCount; }

private:
    bool m_acquired = false;
    int m_acquireCount = 0;
};

} // namespace loom
