#include "http/Target.hpp"

namespace greeting::http {

std::string targetPath(const std::string& target)
{
    std::string path = target.substr(0, target.find_first_of("?#"));
    if (path.empty())
    {
        return "/";
    }
    return path;
}

} // namespace greeting::http
