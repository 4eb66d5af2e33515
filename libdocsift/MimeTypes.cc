#include <docsift/MimeTypes.hh>

#include <docsift/SiftUtil.hh>

#include <algorithm>
#include <utility>

static std::vector<std::pair<std::string, std::string>> const&
extension_map()
{
    static std::vector<std::pair<std::string, std::string>> const map = {
        {".pdf", "application/pdf"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".doc", "application/msword"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".xls", "application/vnd.ms-excel"},
        {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".webp", "image/webp"},
        {".tiff", "image/tiff"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
    };
    return map;
}

std::string
MimeTypes::forExtension(std::string const& extension)
{
    auto ext = SiftUtil::str_lower(extension);
    for (auto const& [key, type]: extension_map()) {
        if (key == ext) {
            return type;
        }
    }
    return "";
}

std::string
MimeTypes::resolve(std::string const& declared, std::string const& file_name)
{
    auto type = SiftUtil::str_lower(declared);
    if (!type.empty() && type != "application/octet-stream") {
        return type;
    }
    auto dot = file_name.rfind('.');
    if (dot != std::string::npos) {
        auto mapped = forExtension(file_name.substr(dot));
        if (!mapped.empty()) {
            return mapped;
        }
    }
    return type.empty() ? "application/octet-stream" : type;
}

std::vector<std::string>
MimeTypes::supportedTypes()
{
    std::vector<std::string> result;
    for (auto const& entry: extension_map()) {
        if (std::find(result.begin(), result.end(), entry.second) == result.end()) {
            result.push_back(entry.second);
        }
    }
    return result;
}
