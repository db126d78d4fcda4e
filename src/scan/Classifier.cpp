#include "scan/Classifier.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <boost/algorithm/string.hpp>

using namespace ds::scan;

namespace {

const std::unordered_map<std::string, std::string>& descriptions() {
    static const std::unordered_map<std::string, std::string> kMap = {
        {"exe", "Executable"},           {"dll", "Dynamic Link Library"},  {"sys", "System File"},
        {"docx", "Word Document"},       {"xlsx", "Excel Spreadsheet"},    {"pptx", "PowerPoint Presentation"},
        {"pdf", "PDF Document"},         {"txt", "Text File"},             {"jpg", "JPEG Image"},
        {"jpeg", "JPEG Image"},          {"png", "PNG Image"},             {"gif", "GIF Image"},
        {"bmp", "BMP Image"},            {"mp3", "MP3 Audio"},             {"wav", "WAV Audio"},
        {"mp4", "MP4 Video"},            {"avi", "AVI Video"},             {"mkv", "MKV Video"},
        {"zip", "ZIP Archive"},          {"rar", "RAR Archive"},           {"7z", "7Z Archive"},
        {"js", "JavaScript File"},       {"css", "CSS Stylesheet"},        {"html", "HTML File"},
        {"json", "JSON File"},           {"xml", "XML File"},              {"sql", "SQL File"},
        {"php", "PHP File"},             {"py", "Python File"},            {"java", "Java File"},
        {"c", "C Source File"},          {"cpp", "C++ Source File"},       {"cs", "C# Source File"},
        {"go", "Go Source File"},        {"rb", "Ruby File"},              {"swift", "Swift File"},
        {"kt", "Kotlin File"},           {"md", "Markdown File"},          {"log", "Log File"},
        {"bak", "Backup File"},          {"tmp", "Temporary File"},
        {NO_EXTENSION, "No Extension"},
    };
    return kMap;
}

constexpr std::array<std::string_view, 8> EXECUTABLE_EXTENSIONS = {
    "exe", "msi", "app", "dmg", "pkg", "appx", "msix", "com"
};

constexpr std::array<std::string_view, 5> APPLICATION_DIR_MARKERS = {
    "program files", "applications", "appdata", "windows\\system32", "windows/system32"
};

const std::unordered_map<std::string, std::string>& friendlyFolderNames() {
    static const std::unordered_map<std::string, std::string> kMap = {
        {"Program Files", "Programs"},
        {"Program Files (x86)", "Programs (x86)"},
        {"Windows", "System"},
        {"Users", "Users"},
        {"AppData", "Application Data"},
        {"Documents", "My Documents"},
        {"Desktop", "Desktop"},
        {"Downloads", "Downloads"},
        {"Pictures", "Pictures"},
        {"Music", "Music"},
        {"Videos", "Videos"},
    };
    return kMap;
}

std::vector<std::string> components(const std::filesystem::path& path) {
    std::vector<std::string> parts;
    for (const auto& part : path.relative_path()) {
        if (auto s = part.string(); !s.empty()) parts.push_back(std::move(s));
    }
    return parts;
}

}

std::string Classifier::extensionOf(const std::filesystem::path& path) {
    auto ext = path.filename().extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(ext.begin());
    if (ext.empty()) return NO_EXTENSION;
    return boost::algorithm::to_lower_copy(ext);
}

std::string Classifier::describe(const std::string& extension) {
    const auto& map = descriptions();
    if (const auto it = map.find(extension); it != map.end()) return it->second;
    return boost::algorithm::to_upper_copy(extension);
}

bool Classifier::isExecutableExtension(const std::string& extension) {
    return std::ranges::find(EXECUTABLE_EXTENSIONS, std::string_view(extension)) != EXECUTABLE_EXTENSIONS.end();
}

bool Classifier::isInApplicationDirectory(const std::filesystem::path& path) {
    const auto lowered = boost::algorithm::to_lower_copy(path.string());
    return std::ranges::any_of(APPLICATION_DIR_MARKERS, [&](const std::string_view marker) {
        return lowered.find(marker) != std::string::npos;
    });
}

bool Classifier::isApplication(const std::filesystem::path& path, const std::string& extension) {
    return isExecutableExtension(extension) || isInApplicationDirectory(path);
}

std::string Classifier::applicationName(const std::filesystem::path& path, const std::string& extension) {
    const auto filename = path.filename();
    if (extension == NO_EXTENSION) return filename.string();
    return filename.stem().string();
}

std::string Classifier::folderDisplayName(const std::filesystem::path& path) {
    if (path.empty()) return "Unknown Folder";

    const auto parts = components(path);
    if (parts.empty()) return "Root";

    const auto& name = parts.back();
    const auto& friendly = friendlyFolderNames();
    if (const auto it = friendly.find(name); it != friendly.end()) return it->second;

    // name a folder below "Program Files" after the program it holds
    const auto programFiles = std::ranges::find_if(parts, [](const std::string& part) {
        return boost::algorithm::icontains(part, "program files");
    });
    if (programFiles != parts.end() && std::next(programFiles) != parts.end())
        return *std::next(programFiles);

    return name;
}
