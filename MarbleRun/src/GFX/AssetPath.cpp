#include "AssetPath.hpp"
#include <filesystem>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <vector>
#else
#include <limits.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

static fs::path GetExecutableDir()
{
#ifdef _WIN32
    std::vector<char> buf(MAX_PATH);
    DWORD len = GetModuleFileNameA(NULL, buf.data(), (DWORD)buf.size());
    if (len == 0) return fs::path();
    return fs::path(std::string(buf.data(), len)).parent_path();
#else
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf)-1);
    if (len == -1) return fs::path();
    buf[len] = '\0';
    return fs::path(buf).parent_path();
#endif
}

namespace MarbleRun {

std::string ResolveAssetPath(const std::string &assetPath)
{
    if (assetPath.empty()) return assetPath;
    fs::path p(assetPath);
    if (p.is_absolute()) return assetPath;

    fs::path exeDir = GetExecutableDir();
    if (exeDir.empty()) return assetPath;
    return (exeDir / p).string();
}

} // namespace MarbleRun
