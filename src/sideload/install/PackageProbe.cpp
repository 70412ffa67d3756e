#include "PackageProbe.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#define MINIZ_NO_ARCHIVE_WRITING_APIS
#include <miniz.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace
{

const std::regex& versionPattern()
{
    static const std::regex pattern(R"([vV]?(\d+\.\d+\.\d+|\d+\.\d+))");
    return pattern;
}

std::string trimSeparators(const std::string& s)
{
    auto isSeparator = [](unsigned char c) { return std::isspace(c) || c == '_' || c == '-' || c == '.'; };
    auto begin = std::find_if_not(s.begin(), s.end(), isSeparator);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSeparator).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

namespace sideload
{

void PackageProbe::GuessNameAndVersion(const std::string& fileName, std::string& outName, std::string& outVersion)
{
    std::string stem = fs::path(fileName).stem().string();

    std::smatch match;
    outVersion.clear();
    if (std::regex_search(stem, match, versionPattern()))
        outVersion = match[1].str();

    std::string name = trimSeparators(std::regex_replace(stem, versionPattern(), ""));
    outName = name.empty() ? stem : name;
}

std::string PackageProbe::GuessPackageName(const std::string& appName)
{
    std::string out;
    for (unsigned char c : appName)
    {
        if (std::isalnum(c))
            out.push_back(static_cast<char>(std::tolower(c)));
        else if (!out.empty() && out.back() != '.')
            out.push_back('.');
    }
    while (!out.empty() && out.back() == '.')
        out.pop_back();
    return out;
}

bool PackageProbe::Probe(const std::string& filePath, PackageInfo& outInfo, std::string& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec))
    {
        outError = "Package file does not exist: " + filePath;
        return false;
    }

    outInfo = PackageInfo{};
    outInfo.fileName = fs::path(filePath).filename().string();
    outInfo.sizeBytes = fs::file_size(filePath, ec);
    if (ec)
    {
        outError = "Cannot read package size: " + ec.message();
        return false;
    }
    GuessNameAndVersion(outInfo.fileName, outInfo.appName, outInfo.version);
    outInfo.packageName = GuessPackageName(outInfo.appName);

    mz_zip_archive zip{};
    if (!mz_zip_reader_init_file(&zip, filePath.c_str(), 0))
    {
        PLOG_WARNING << "Package is not a readable archive: " << filePath;
        return true;
    }

    outInfo.isArchive = true;
    outInfo.entryCount = static_cast<int>(mz_zip_reader_get_num_files(&zip));
    outInfo.hasManifest = mz_zip_reader_locate_file(&zip, "AndroidManifest.xml", nullptr, 0) >= 0;
    outInfo.hasDex = mz_zip_reader_locate_file(&zip, "classes.dex", nullptr, 0) >= 0;
    mz_zip_reader_end(&zip);

    PLOG_INFO << "Probed " << outInfo.fileName << ": " << outInfo.entryCount << " entries, manifest "
              << (outInfo.hasManifest ? "present" : "missing") << ", name '" << outInfo.appName << "'"
              << (outInfo.version.empty() ? "" : ", version " + outInfo.version);
    return true;
}

} // namespace sideload
