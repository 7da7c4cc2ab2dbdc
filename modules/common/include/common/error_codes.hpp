#pragma once

#include <string>
#include <system_error>

namespace tacto {

enum class Error {
    Success = 0,
    GlfwError = 1,
    GlfwWindowCreationFailed = 2,
    WindowNotInitialized = 3,
    InvalidKeyCode = 4,
    InvalidGamepadButton = 5,
    InvalidMapping = 6,
    DuplicateMapping = 7,
    InvalidRepeatTiming = 8,
    InvalidAxisThreshold = 9,
    InvalidCanvasSize = 10,
};

}

namespace std {

// Tell the C++ 11 STL metaprogramming that our error code
// is registered with the standard error code system
template <>
struct is_error_code_enum<tacto::Error> : std::true_type {};

}  // namespace std

namespace detail {
// Define a custom error code category derived from std::error_category
class TactoError_category : public std::error_category {
  public:
    // Return a short descriptive name for the category
    virtual const char *name() const noexcept override final {
        return "TactoError";
    }

    // Return what each enum means in text
    virtual std::string message(int c) const override final {
        switch (static_cast<tacto::Error>(c)) {
            case tacto::Error::Success:
                return "success";
            case tacto::Error::GlfwError:
                return "GLFW error";
            case tacto::Error::GlfwWindowCreationFailed:
                return "GLFW could not create a window";
            case tacto::Error::WindowNotInitialized:
                return "window not initialized";
            case tacto::Error::InvalidKeyCode:
                return "key code out of range";
            case tacto::Error::InvalidGamepadButton:
                return "gamepad button index out of range";
            case tacto::Error::InvalidMapping:
                return "mapping has no target button";
            case tacto::Error::DuplicateMapping:
                return "code is mapped more than once";
            case tacto::Error::InvalidRepeatTiming:
                return "invalid key repeat timing";
            case tacto::Error::InvalidAxisThreshold:
                return "axis threshold must lie between 0 and 1";
            case tacto::Error::InvalidCanvasSize:
                return "canvas size must be positive";
            default:
                return "unknown error";
        }
    }
};
}  // namespace detail

// Declare a global function returning a static instance of the custom category
extern inline const detail::TactoError_category &TactoError_category() {
    static detail::TactoError_category c;
    return c;
}

namespace tacto {

// Overload make_error_code() for our custom enum. It is found via ADL
// when an Error is converted to std::error_code.
inline std::error_code make_error_code(Error e) {
    return {static_cast<int>(e), TactoError_category()};
}

}  // namespace tacto
