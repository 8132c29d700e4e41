#include "progressbar/common/paths.hpp"
#include "progressbar/common/constants.hpp"
#include <cstdlib>

namespace progressbar {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env != '\0') {
            paths.push_back(env);
        }
    }
    
    std::string user_file = getUserConfigFile();
    if (!user_file.empty()) {
        paths.push_back(user_file);
    }
    
    paths.push_back(getSystemConfigFile());
    
    return paths;
}

std::string PathManager::getUserConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "";
    }
    return base + "/" + constants::system::APPLICATION_NAME;
}

std::string PathManager::getSystemConfigDir() const {
    return constants::system::SYSTEM_CONFIG_DIR;
}

std::string PathManager::getUserConfigFile() const {
    std::string dir = getUserConfigDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getSystemConfigFile() const {
    return getSystemConfigDir() + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getXdgConfigHome() const {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg != '\0') {
            return xdg;
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config";
    }
    return "";
}

}}
