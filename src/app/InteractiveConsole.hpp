#pragma once

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace app
{

enum class InputType
{
    Login,
    Password,
    PhoneNumber,
    Sms,
    EmailCode,
    ParentalPin,
    RevocationCode, // Shows the code and waits for enter
    TwoFactorCode
};

// Serialized access to the terminal for credential prompts. Prompts from different
// workers never interleave; the screen is cleared after every answer.
class InteractiveConsole
{
public:
    InteractiveConsole();
    InteractiveConsole(std::istream& in, std::ostream& out, bool clearScreen = true);

    InteractiveConsole(const InteractiveConsole&) = delete;
    InteractiveConsole& operator=(const InteractiveConsole&) = delete;

    // Returns the trimmed answer, or nullopt when the answer is empty or input is closed
    std::optional<std::string> prompt(const std::string& worker, InputType type, const std::string& extra = "");

    // True while a prompt is waiting for input
    bool isBusy() const { return busy_.load(); }

    static std::string PromptText(InputType type, const std::string& extra);

private:
    std::istream& in_;
    std::ostream& out_;
    bool clear_screen_;

    std::mutex mutex_;
    std::atomic<bool> busy_{ false };
};

} // namespace app
