#include "Version.hpp"

#include <algorithm>
#include <cstring>

namespace updater
{

Version::Version(std::string versionString)
    : text_(std::move(versionString))
{
}

std::strong_ordering Version::operator<=>(const Version& other) const
{
    int cmp = compareOrdinal(text_, other.text_);
    if (cmp < 0)
        return std::strong_ordering::less;
    if (cmp > 0)
        return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

int Version::compareOrdinal(std::string_view lhs, std::string_view rhs)
{
    const size_t common = std::min(lhs.size(), rhs.size());
    if (common > 0)
    {
        int cmp = std::memcmp(lhs.data(), rhs.data(), common);
        if (cmp != 0)
            return cmp < 0 ? -1 : 1;
    }

    if (lhs.size() == rhs.size())
        return 0;
    return lhs.size() < rhs.size() ? -1 : 1;
}

} // namespace updater
