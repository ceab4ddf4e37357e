#include "InteractiveConsole.hpp"

#include <iostream>

namespace app
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

InteractiveConsole::InteractiveConsole()
    : InteractiveConsole(std::cin, std::cout)
{
}

InteractiveConsole::InteractiveConsole(std::istream& in, std::ostream& out, bool clearScreen)
    : in_(in)
    , out_(out)
    , clear_screen_(clearScreen)
{
}

std::string InteractiveConsole::PromptText(InputType type, const std::string& extra)
{
    switch (type)
    {
    case InputType::Login:
        return "Please enter your login: ";
    case InputType::Password:
        return "Please enter your password: ";
    case InputType::PhoneNumber:
        return "Please enter your full phone number (e.g. +1234567890): ";
    case InputType::Sms:
        return "Please enter SMS code sent on your mobile: ";
    case InputType::EmailCode:
        return "Please enter the auth code sent to your email: ";
    case InputType::ParentalPin:
        return "Please enter parental PIN: ";
    case InputType::RevocationCode:
        return "PLEASE WRITE DOWN YOUR REVOCATION CODE: " + extra;
    case InputType::TwoFactorCode:
        return "Please enter your 2 factor auth code from your authenticator app: ";
    }
    return "Please enter value: ";
}

std::optional<std::string> InteractiveConsole::prompt(const std::string& worker, InputType type,
                                                      const std::string& extra)
{
    std::lock_guard<std::mutex> lock(mutex_);
    busy_ = true;

    const std::string tag = "<" + worker + "> ";
    if (type == InputType::RevocationCode)
    {
        out_ << tag << PromptText(type, extra) << '\n';
        out_ << tag << "THIS IS THE ONLY WAY TO NOT GET LOCKED OUT OF YOUR ACCOUNT!" << '\n';
        out_ << tag << "Hit enter once ready...";
    }
    else
    {
        out_ << tag << PromptText(type, extra);
    }
    out_.flush();

    std::string line;
    bool gotLine = static_cast<bool>(std::getline(in_, line));

    if (clear_screen_)
    {
        out_ << "\033[2J\033[H";
        out_.flush();
    }
    busy_ = false;

    if (!gotLine)
        return std::nullopt;

    std::string answer = trim(line);
    if (answer.empty())
        return std::nullopt;
    return answer;
}

} // namespace app
