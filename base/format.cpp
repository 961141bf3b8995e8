// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "config.h"

#include <cstdio>
#include <cstring>
#include <cctype>
#include <locale>
#include <iomanip>
#include <sstream>

#include "base/format.h"

namespace base {
namespace detail {
#if defined(BASE_FORMAT_SUPPORT_GLM)
std::string ToString(const glm::mat4& m)
{
    const auto& x = m[0];
    const auto& y = m[1];
    const auto& z = m[2];
    const auto& w = m[3];

    char buff[1024];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
       "[%.2f %.2f %.2f %.2f],"
       "[%.2f %.2f %.2f %.2f],"
       "[%.2f %.2f %.2f %.2f],"
       "[%.2f %.2f %.2f %.2f]",
       x[0], x[1], x[2], x[3],
       y[0], y[1], y[2], y[3],
       z[0], z[1], z[2], z[3],
       w[0], w[1], w[2], w[3]);
    return buff;
}

std::string ToString(const glm::vec4& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
       "[%.2f %.2f %.2f %.2f]", v[0], v[1], v[2], v[3]);
    return buff;
}

std::string ToString(const glm::vec3& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.2f %.2f %.2f]", v[0], v[1], v[2]);
    return buff;
}

std::string ToString(const glm::vec2& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.2f %.2f]", v[0], v[1]);
    return buff;
}
std::string ToString(const glm::ivec2& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff), "[%d %d]", v[0], v[1]);
    return buff;
}
#endif // BASE_FORMAT_SUPPORT_GLM

} // detail

std::string TrimString(const std::string& str)
{
    const auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && is_space(str[begin]))
        ++begin;
    while (end > begin && is_space(str[end-1]))
        --end;
    return str.substr(begin, end - begin);
}

std::string ToChars(float value, unsigned precision)
{
    // c++17 has to_chars in <charconv> but GCC (stdlib) doesn't
    // yet support float conversion. gah.
    std::stringstream ss;
    std::string ret;
    ss.imbue(std::locale::classic());
    ss << std::fixed << std::setprecision(precision) << value;
    ss >> ret;
    return ret;
}
std::string ToChars(int value)
{
    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << value;
    return ss.str();
}
std::string ToChars(unsigned value)
{
    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << value;
    return ss.str();
}

} // namespace
