#include "symbol_codec.hpp"
#include <cctype>

std::string SymbolCodec::to_canonical(const std::string &v)
{
    const auto first = v.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = v.find_last_not_of(" \t\r\n");
    std::string c = v.substr(first, last - first + 1);
    for (auto &ch : c)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return c;
}

std::string SymbolCodec::to_stream_path(const std::string &canonical, const std::string &channel)
{
    return "/ws/" + to_canonical(canonical) + "@" + channel;
}
