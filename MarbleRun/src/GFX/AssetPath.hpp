#pragma once

#include <string>

namespace MarbleRun {

// Resolve an asset path relative to the executable directory when a relative path is provided.
std::string ResolveAssetPath(const std::string &assetPath);

} // namespace MarbleRun
