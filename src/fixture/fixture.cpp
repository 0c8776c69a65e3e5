#include "polcanon/fixture.hpp"

namespace polcanon {

namespace {

size_t last_separator(const std::string& path) {
#ifdef _WIN32
    return path.find_last_of("/\\");
#else
    return path.rfind('/');
#endif
}

} // namespace

std::string path_extension(const std::string& path) {
    size_t sep = last_separator(path);
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (sep != std::string::npos && dot < sep)) {
        return "";
    }
    return path.substr(dot);
}

std::string expected_path_for(const std::string& test_path) {
    std::string ext = path_extension(test_path);
    return test_path.substr(0, test_path.size() - ext.size()) + EXPECTED_EXTENSION;
}

std::string test_name_from_path(const std::string& test_path) {
    size_t sep = last_separator(test_path);
    std::string name = sep == std::string::npos ? test_path : test_path.substr(sep + 1);
    return name.substr(0, name.size() - path_extension(name).size());
}

} // namespace polcanon
