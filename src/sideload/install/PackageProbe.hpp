#pragma once

#include <cstdint>
#include <string>

namespace sideload
{

// Best-effort metadata about a downloaded package. Informational only, never
// used to decide whether a package gets installed.
struct PackageInfo
{
    std::string fileName;
    std::uint64_t sizeBytes = 0;
    std::string appName; // Guessed from the file name
    std::string version; // Guessed from the file name, empty when none found
    std::string packageName; // Dotted identifier derived from the app name
    bool isArchive = false; // Opens as a ZIP archive
    int entryCount = 0;
    bool hasManifest = false; // AndroidManifest.xml present
    bool hasDex = false; // classes.dex present

    bool looksInstallable() const { return isArchive && hasManifest; }
};

class PackageProbe
{
public:
    // Returns false with outError when the file cannot be read at all
    static bool Probe(const std::string& filePath, PackageInfo& outInfo, std::string& outError);

    // "My App v1.2.3.apk" -> name "My App", version "1.2.3"
    static void GuessNameAndVersion(const std::string& fileName, std::string& outName, std::string& outVersion);

    // "My App" -> "my.app"
    static std::string GuessPackageName(const std::string& appName);
};

} // namespace sideload
