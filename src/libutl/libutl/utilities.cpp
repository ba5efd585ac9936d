#include <libutl/utilities.hpp>

auto knit::utl::escape(std::string_view const string) -> std::string
{
    std::string output;
    output.reserve(string.size());
    for (char const character : string) {
        switch (character) {
        case '\n': output.append("\\n"); break;
        case '\r': output.append("\\r"); break;
        case '\t': output.append("\\t"); break;
        case '\"': output.append("\\\""); break;
        case '\\': output.append("\\\\"); break;
        default:   output.push_back(character);
        }
    }
    return output;
}
