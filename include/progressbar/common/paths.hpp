#pragma once

#include <string>
#include <vector>

namespace progressbar {
namespace common {

class PathManager {
public:
    static PathManager& instance();
    
    std::string getUserConfigDir() const;
    std::string getSystemConfigDir() const;
    std::string getUserConfigFile() const;
    std::string getSystemConfigFile() const;
    
    // Environment override first, then user, then system.
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;
    
    std::string getXdgConfigHome() const;
};

}}
