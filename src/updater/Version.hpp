#pragma once

#include <compare>
#include <string>
#include <string_view>

namespace updater
{

// Version string compared ordinally, byte by byte.
// Not component-aware: "1.10.0.0" orders before "1.9.0.0".
class Version
{
public:
    Version() = default;

    // Construct from version string (e.g., "1.2.0.0")
    explicit Version(std::string versionString);

    const std::string& toString() const { return text_; }

    bool empty() const { return text_.empty(); }

    std::strong_ordering operator<=>(const Version& other) const;
    bool operator==(const Version& other) const = default;

    // <0, 0, >0 like strcmp, on unsigned bytes
    static int compareOrdinal(std::string_view lhs, std::string_view rhs);

private:
    std::string text_;
};

} // namespace updater
